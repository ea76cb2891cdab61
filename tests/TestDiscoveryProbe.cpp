// Copyright (c) 2015-2026 Josh Blum
// SPDX-License-Identifier: BSL-1.0

#include "SSDPDiscoveryProbe.hpp"
#include "SSDPDiscoveryRequest.hpp"
#include "SSDPHTTPUtils.hpp"
#include "SSDPProbeDefs.hpp"
#include "SSDPSocket.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <climits>
#include <future>
#include <thread>
#include <stdexcept>
#include <vector>
#include <cerrno>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>
#include <sys/resource.h>
#include <sys/select.h> //FD_SETSIZE

/***********************************************************************
 * Loopback responder: a plain UDP socket on 127.0.0.1 standing in
 * for the listener under test, the probe is pointed at it via "group"
 **********************************************************************/
struct LoopbackResponder
{
    LoopbackResponder(void)
    {
        if (sock.bind("udp://127.0.0.1:0") != 0) throw std::runtime_error(sock.lastErrorMsg());
        addr = sock.getsockname();
    }

    SoapySDR::Kwargs probeArgs(void) const
    {
        SoapySDR::Kwargs args;
        args["group"] = "udp://" + addr;
        return args;
    }

    //wait for one request, then answer it after a delay; the future yields the request
    std::future<std::string> replyOnce(const std::string &reply, const long delayUs)
    {
        return std::async(std::launch::async, [this, reply, delayUs]() -> std::string
        {
            if (sock.selectRecv(5*1000*1000) != 1) return std::string();
            char buff[2048];
            std::string peer;
            const int ret = sock.recvfrom(buff, sizeof(buff), peer);
            if (ret < 0) return std::string();
            std::this_thread::sleep_for(std::chrono::microseconds(delayUs));
            if (sock.sendto(reply.data(), reply.size(), peer) != int(reply.size())) return std::string();
            return std::string(buff, size_t(ret));
        });
    }

    SSDPSocket sock;
    std::string addr;
};

static double secondsSince(const std::chrono::steady_clock::time_point &start)
{
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

static int countOpenDescriptors(void)
{
    DIR *dir = opendir("/proc/self/fd");
    if (dir == nullptr) return -1;
    int count = 0;
    while (readdir(dir) != nullptr) count++;
    closedir(dir);
    return count;
}

//! Adjusts the soft descriptor limit, the original limit is restored on exit
struct DescriptorLimit
{
    DescriptorLimit(void):
        valid(getrlimit(RLIMIT_NOFILE, &saved) == 0)
    {
        return;
    }

    ~DescriptorLimit(void)
    {
        if (valid and setrlimit(RLIMIT_NOFILE, &saved) != 0) ADD_FAILURE() << "setrlimit restore failed";
    }

    bool setSoft(const rlim_t soft)
    {
        struct rlimit lim = saved;
        lim.rlim_cur = soft;
        return valid and setrlimit(RLIMIT_NOFILE, &lim) == 0;
    }

    struct rlimit saved;
    const bool valid;
};

/***********************************************************************
 * Replies
 **********************************************************************/
TEST(DiscoveryProbe, RepliedWithExactPayload)
{
    LoopbackResponder responder;
    const std::string reply("HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n");
    auto request = responder.replyOnce(reply, 100*1000);

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(responder.probeArgs()).probe("upnp:rootdevice", 3, 5*1000*1000);
    EXPECT_LT(secondsSince(start), 1.0);

    ASSERT_TRUE(outcome.isReplied()) << outcome.getStatusName() << " " << outcome.getErrorMessage();
    EXPECT_EQ(outcome.getResponse().getPayload(), reply);
    EXPECT_EQ(outcome.getResponse().getSourceURL(), responder.addr);
    EXPECT_EQ(outcome.getResponse().getSourceHost(), "127.0.0.1");
    EXPECT_TRUE(outcome.getResponse().isWellFormed());

    //the responder saw the exact M-SEARCH bytes
    EXPECT_EQ(request.get(), SSDPDiscoveryRequest("upnp:rootdevice", 3).toString());
}

TEST(DiscoveryProbe, MalformedRepliesStillCount)
{
    const std::string payloads[] = {
        std::string(),
        std::string("\xff\xfe\x00\x80garbage", 11),
        std::string("HTTP/1.1 200 OK\r\nLOCATION: http://10.0"),
        std::string("NOTIFY * HTTP/1.1\r\n"),
    };

    for (const auto &payload : payloads)
    {
        LoopbackResponder responder;
        auto request = responder.replyOnce(payload, 0);
        const auto outcome = SSDPDiscoveryProbe(responder.probeArgs()).probe("ssdp:all", 1, 2*1000*1000);
        ASSERT_TRUE(outcome.isReplied()) << outcome.getStatusName() << " " << outcome.getErrorMessage();
        EXPECT_EQ(outcome.getResponse().getPayload(), payload);
        EXPECT_FALSE(outcome.getResponse().isWellFormed());
        EXPECT_FALSE(request.get().empty());
    }
}

TEST(DiscoveryProbe, OnlyFirstReplyIsReported)
{
    LoopbackResponder responder;
    auto answered = std::async(std::launch::async, [&responder]() -> bool
    {
        if (responder.sock.selectRecv(5*1000*1000) != 1) return false;
        char buff[2048];
        std::string peer;
        if (responder.sock.recvfrom(buff, sizeof(buff), peer) < 0) return false;
        if (responder.sock.sendto("first", 5, peer) != 5) return false;
        return responder.sock.sendto("second", 6, peer) == 6;
    });

    const auto outcome = SSDPDiscoveryProbe(responder.probeArgs()).probe("ssdp:all", 1, 2*1000*1000);
    EXPECT_TRUE(answered.get());
    ASSERT_TRUE(outcome.isReplied());
    EXPECT_EQ(outcome.getResponse().getPayload(), "first");
}

TEST(DiscoveryProbe, MulticastGroupReachesLocalListener)
{
    //a listener on this host joined to the standard group
    SSDPSocket listener;
    if (listener.bind("udp://0.0.0.0:" SSDP_UDP_PORT_NUMBER) != 0)
    {
        GTEST_SKIP() << "cannot bind the discovery port: " << listener.lastErrorMsg();
    }
    if (listener.multicastJoin(SSDP_PROBE_DEFAULT_GROUP) != 0)
    {
        GTEST_SKIP() << "cannot join " SSDP_PROBE_DEFAULT_GROUP ": " << listener.lastErrorMsg();
    }

    //a search target no real device on the network answers
    const std::string st("urn:ssdp-probe-selftest:service:Loopback:1");
    const std::string reply("HTTP/1.1 200 OK\r\nST: " + st + "\r\nUSN: uuid:loopback::" + st + "\r\n\r\n");
    auto request = std::async(std::launch::async, [&listener, &st, &reply]() -> std::string
    {
        const auto exitTime = std::chrono::steady_clock::now() + std::chrono::seconds(3);
        while (std::chrono::steady_clock::now() < exitTime)
        {
            const auto remainingUs = std::chrono::duration_cast<std::chrono::microseconds>(exitTime - std::chrono::steady_clock::now()).count();
            if (listener.selectRecv(long(remainingUs)) != 1) break;
            std::vector<char> buff(SSDP_PROBE_RECV_BUFFMAX);
            std::string peer;
            const int ret = listener.recvfrom(buff.data(), buff.size(), peer);
            if (ret < 0) break;

            //skip other discovery traffic on the segment
            const SSDPHTTPHeader header(buff.data(), size_t(ret));
            if (header.getField("ST") != st) continue;
            if (listener.sendto(reply.data(), reply.size(), peer) != int(reply.size())) break;
            return std::string(buff.data(), size_t(ret));
        }
        return std::string();
    });

    const auto outcome = SSDPDiscoveryProbe().probe(st, 1, 3*1000*1000);
    const auto seen = request.get();
    if (outcome.isTransportError())
    {
        GTEST_SKIP() << "no multicast route: " << outcome.getErrorMessage();
    }

    ASSERT_TRUE(outcome.isReplied()) << outcome.getStatusName();
    EXPECT_EQ(outcome.getResponse().getPayload(), reply);
    EXPECT_EQ(seen, SSDPDiscoveryRequest(st, 1).toString());
}

TEST(DiscoveryProbe, HighNumberedDescriptorStillReplies)
{
    //push the probe socket past the capacity of an fd_set
    const int target = FD_SETSIZE + 8;
    DescriptorLimit limit;
    ASSERT_TRUE(limit.valid);
    if (limit.saved.rlim_cur != RLIM_INFINITY and limit.saved.rlim_cur < rlim_t(target + 64))
    {
        if (not limit.setSoft(rlim_t(target + 64)))
        {
            GTEST_SKIP() << "descriptor limit " << limit.saved.rlim_max << " too low for " << target;
        }
    }

    std::vector<int> fillers;
    const int base = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(base, 0);
    fillers.push_back(base);
    while (fillers.back() < target)
    {
        const int fd = ::dup(base);
        if (fd < 0) break;
        fillers.push_back(fd);
    }
    const bool filled = fillers.back() >= target;

    if (filled)
    {
        LoopbackResponder responder;
        auto request = responder.replyOnce("HTTP/1.1 200 OK\r\n\r\n", 0);
        const auto outcome = SSDPDiscoveryProbe(responder.probeArgs()).probe("ssdp:all", 1, 2*1000*1000);
        EXPECT_TRUE(outcome.isReplied()) << outcome.getStatusName() << " " << outcome.getErrorMessage();
        EXPECT_FALSE(request.get().empty());
    }

    for (const int fd : fillers) ::close(fd);
    EXPECT_TRUE(filled) << "dup() stopped at " << fillers.back();
}

/***********************************************************************
 * Timeouts
 **********************************************************************/
TEST(DiscoveryProbe, TimedOutWithinBound)
{
    LoopbackResponder silent; //bound but never answers

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(silent.probeArgs()).probe("upnp:rootdevice", 1, 300*1000);
    const double elapsed = secondsSince(start);

    EXPECT_TRUE(outcome.isTimedOut()) << outcome.getStatusName() << " " << outcome.getErrorMessage();
    EXPECT_GE(elapsed, 0.29);
    EXPECT_LT(elapsed, 0.8);
}

TEST(DiscoveryProbe, NonexistentServiceTimesOutAfterTwoSeconds)
{
    LoopbackResponder silent;

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(silent.probeArgs()).probe("urn:nonexistent:service:1", 1, 2*1000*1000);
    const double elapsed = secondsSince(start);

    EXPECT_TRUE(outcome.isTimedOut());
    EXPECT_GE(elapsed, 1.95);
    EXPECT_LT(elapsed, 3.0);
}

TEST(DiscoveryProbe, ZeroTimeoutPollsOnce)
{
    LoopbackResponder silent;
    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(silent.probeArgs()).probe("ssdp:all", 1, 0);
    EXPECT_TRUE(outcome.isTimedOut());
    EXPECT_LT(secondsSince(start), 0.5);
}

TEST(DiscoveryProbe, LongestTimeoutStillWaitsForReply)
{
    LoopbackResponder responder;
    auto request = responder.replyOnce("HTTP/1.1 200 OK\r\n\r\n", 100*1000);
    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(responder.probeArgs()).probe("ssdp:all", 1, SSDP_PROBE_MAX_TIMEOUT_US);
    EXPECT_TRUE(outcome.isReplied()) << outcome.getStatusName() << " " << outcome.getErrorMessage();
    EXPECT_GE(secondsSince(start), 0.09);
    EXPECT_FALSE(request.get().empty());
}

TEST(DiscoveryProbe, SocketWaitClampsHugeTimeout)
{
    SSDPSocket sock;
    ASSERT_EQ(sock.bind("udp://127.0.0.1:0"), 0) << sock.lastErrorMsg();
    const auto self = sock.getsockname();
    ASSERT_EQ(sock.sendto("x", 1, self), 1) << sock.lastErrorMsg();

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(sock.selectRecv(LONG_MAX), 1);
    EXPECT_LT(secondsSince(start), 1.0);
}

/***********************************************************************
 * Transport errors
 **********************************************************************/
TEST(DiscoveryProbe, SocketDeniedIsPromptTransportError)
{
    //the next descriptor number is the lowest free one, a limit at it denies socket()
    const int next = ::open("/dev/null", O_RDONLY);
    ASSERT_GE(next, 0);
    ::close(next);

    DescriptorLimit limit;
    ASSERT_TRUE(limit.setSoft(rlim_t(next)));

    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe().probe("ssdp:all", 1, 5*1000*1000);
    EXPECT_LT(secondsSince(start), 1.0);
    ASSERT_TRUE(outcome.isTransportError()) << outcome.getStatusName();
    EXPECT_EQ(outcome.getErrorCode(), EMFILE);
    EXPECT_NE(outcome.getErrorMessage().find("socket("), std::string::npos) << outcome.getErrorMessage();
}

TEST(DiscoveryProbe, SendFailureIsTransportError)
{
    SoapySDR::Kwargs args;
    args["group"] = "udp://127.0.0.1:0";
    const auto outcome = SSDPDiscoveryProbe(args).probe("ssdp:all", 1, 2*1000*1000);
    ASSERT_TRUE(outcome.isTransportError()) << outcome.getStatusName();
    EXPECT_EQ(outcome.getErrorCode(), EINVAL);
    EXPECT_NE(outcome.getErrorMessage().find("sendto"), std::string::npos) << outcome.getErrorMessage();
}

TEST(DiscoveryProbe, GroupWithoutPortIsTransportError)
{
    SoapySDR::Kwargs args;
    args["group"] = "udp://239.255.255.250";
    const auto outcome = SSDPDiscoveryProbe(args).probe("ssdp:all", 1, 2*1000*1000);
    ASSERT_TRUE(outcome.isTransportError());
    EXPECT_NE(outcome.getErrorMessage().find("service not specified"), std::string::npos) << outcome.getErrorMessage();
}

TEST(DiscoveryProbe, BindFailureIsPromptTransportError)
{
    SoapySDR::Kwargs args;
    args["group"] = "udp://127.0.0.1:1900";
    args["bind"] = "203.0.113.77"; //documentation range, not a local address
    const auto start = std::chrono::steady_clock::now();
    const auto outcome = SSDPDiscoveryProbe(args).probe("ssdp:all", 1, 5*1000*1000);
    EXPECT_LT(secondsSince(start), 1.0);
    ASSERT_TRUE(outcome.isTransportError());
    EXPECT_EQ(outcome.getErrorCode(), EADDRNOTAVAIL);
    EXPECT_NE(outcome.getErrorMessage().find("bind"), std::string::npos) << outcome.getErrorMessage();
}

/***********************************************************************
 * Resources
 **********************************************************************/
TEST(DiscoveryProbe, NoDescriptorLeak)
{
    if (countOpenDescriptors() < 0) GTEST_SKIP() << "no /proc/self/fd";

    LoopbackResponder silent;
    SoapySDR::Kwargs badArgs;
    badArgs["group"] = "udp://127.0.0.1:0";
    const SSDPDiscoveryProbe timeoutProbe(silent.probeArgs());
    const SSDPDiscoveryProbe errorProbe(badArgs);

    const int before = countOpenDescriptors();
    for (size_t i = 0; i < 50; i++)
    {
        EXPECT_TRUE(timeoutProbe.probe("ssdp:all", 1, 1000).isTimedOut());
        EXPECT_TRUE(errorProbe.probe("ssdp:all", 1, 1000).isTransportError());
    }
    EXPECT_EQ(countOpenDescriptors(), before);
}

TEST(DiscoveryProbe, NoDescriptorLeakAfterReplies)
{
    if (countOpenDescriptors() < 0) GTEST_SKIP() << "no /proc/self/fd";

    LoopbackResponder responder;
    const SSDPDiscoveryProbe probe(responder.probeArgs());
    const int before = countOpenDescriptors();
    for (size_t i = 0; i < 10; i++)
    {
        auto request = responder.replyOnce("HTTP/1.1 200 OK\r\n\r\n", 0);
        EXPECT_TRUE(probe.probe("ssdp:all", 1, 2*1000*1000).isReplied());
        request.get();
    }
    EXPECT_EQ(countOpenDescriptors(), before);
}

/***********************************************************************
 * Arguments and settings
 **********************************************************************/
TEST(DiscoveryProbe, InvalidArgumentsThrowBeforeSending)
{
    const SSDPDiscoveryProbe probe;
    EXPECT_THROW(probe.probe("", 3, 1000), std::invalid_argument);
    EXPECT_THROW(probe.probe("rootdevice", 3, 1000), std::invalid_argument);
    EXPECT_THROW(probe.probe("ssdp:all", 0, 1000), std::invalid_argument);
    EXPECT_THROW(probe.probe("ssdp:all", 3, -1), std::invalid_argument);
    EXPECT_THROW(probe.probe("ssdp:all", 3, SSDP_PROBE_MAX_TIMEOUT_US+1), std::invalid_argument);
    EXPECT_THROW(probe.probe("ssdp:all", 3, LONG_MAX), std::invalid_argument);
}

TEST(DiscoveryProbe, DefaultSettings)
{
    const SSDPDiscoveryProbe probe;
    EXPECT_EQ(probe.getGroupURL(), "udp://239.255.255.250:1900");
    EXPECT_EQ(probe.getBindURL(), "udp://0.0.0.0:0");
}

TEST(DiscoveryProbe, IPv6GroupBindsIPv6Wildcard)
{
    SoapySDR::Kwargs args;
    args["group"] = "udp://[ff02::c]:1900";
    EXPECT_EQ(SSDPDiscoveryProbe(args).getBindURL(), "udp://[::]:0");
}

TEST(DiscoveryProbe, UnbracketedIPv6GroupThrows)
{
    SoapySDR::Kwargs args;
    args["group"] = "udp://ff02::c:1900";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);

    args["group"] = "ff02::c";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);

    args["group"] = "udp://[ff02::c]:1900";
    EXPECT_NO_THROW(SSDPDiscoveryProbe probe(args));
}

TEST(DiscoveryProbe, GroupWithoutSchemeIsDatagram)
{
    SoapySDR::Kwargs args;
    args["group"] = "127.0.0.1:1900";
    args["bind"] = "127.0.0.1";
    const SSDPDiscoveryProbe probe(args);
    EXPECT_EQ(probe.getGroupURL(), "udp://127.0.0.1:1900");
    EXPECT_EQ(probe.getBindURL(), "udp://127.0.0.1:0");
}

TEST(DiscoveryProbe, MalformedSettingsThrow)
{
    SoapySDR::Kwargs args;
    args["ttl"] = "four";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);

    args.clear();
    args["ttl"] = "300";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);

    args.clear();
    args["loop"] = "maybe";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);

    args.clear();
    args["group"] = "tcp://239.255.255.250:1900";
    EXPECT_THROW(SSDPDiscoveryProbe probe(args), std::invalid_argument);
}
