#include <gtest/gtest.h>

#include "netlink_monitor.hpp"

#include <linux/netlink.h>
#include <linux/rtnetlink.h>
#include <cstring>
#include <vector>

namespace netreach {
namespace test {

namespace {

// Appends an empty-payload netlink message of the given type
void append_message(std::vector<char>& buffer, uint16_t type, size_t payload = 0) {
    size_t offset = buffer.size();
    size_t length = NLMSG_LENGTH(payload);
    buffer.resize(offset + NLMSG_ALIGN(length), 0);

    struct nlmsghdr header;
    memset(&header, 0, sizeof(header));
    header.nlmsg_len = static_cast<uint32_t>(length);
    header.nlmsg_type = type;
    memcpy(buffer.data() + offset, &header, sizeof(header));
}

} // namespace

TEST(NetlinkMonitorTest, ClassifiesLinkAndAddressMessages) {
    EXPECT_TRUE(NetlinkMonitor::is_reachability_message(RTM_NEWLINK));
    EXPECT_TRUE(NetlinkMonitor::is_reachability_message(RTM_DELLINK));
    EXPECT_TRUE(NetlinkMonitor::is_reachability_message(RTM_NEWADDR));
    EXPECT_TRUE(NetlinkMonitor::is_reachability_message(RTM_DELADDR));

    EXPECT_FALSE(NetlinkMonitor::is_reachability_message(RTM_NEWROUTE));
    EXPECT_FALSE(NetlinkMonitor::is_reachability_message(RTM_NEWNEIGH));
    EXPECT_FALSE(NetlinkMonitor::is_reachability_message(NLMSG_DONE));
}

TEST(NetlinkMonitorTest, BatchWithAddressChangeCounts) {
    std::vector<char> buffer;
    append_message(buffer, RTM_NEWROUTE, 12);
    append_message(buffer, RTM_NEWADDR, 8);
    append_message(buffer, NLMSG_DONE);

    EXPECT_TRUE(NetlinkMonitor::batch_has_reachability_change(buffer.data(), buffer.size()));
}

TEST(NetlinkMonitorTest, BatchWithoutLinkOrAddressIsIgnored) {
    std::vector<char> buffer;
    append_message(buffer, RTM_NEWROUTE, 12);
    append_message(buffer, RTM_NEWNEIGH, 4);
    append_message(buffer, NLMSG_DONE);

    EXPECT_FALSE(NetlinkMonitor::batch_has_reachability_change(buffer.data(), buffer.size()));
}

TEST(NetlinkMonitorTest, TruncatedBatchIsIgnored) {
    std::vector<char> buffer;
    append_message(buffer, RTM_NEWLINK, 16);

    EXPECT_FALSE(NetlinkMonitor::batch_has_reachability_change(buffer.data(), sizeof(struct nlmsghdr) - 1));
    EXPECT_FALSE(NetlinkMonitor::batch_has_reachability_change(buffer.data(), 0));
}

TEST(NetlinkMonitorTest, StopWithoutStartIsHarmless) {
    ChangeSignal signal;
    NetlinkMonitor monitor(signal);
    EXPECT_FALSE(monitor.is_running());
    EXPECT_NO_THROW(monitor.stop());
}

} // namespace test
} // namespace netreach
