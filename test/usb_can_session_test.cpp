// Copyright (c) 2025 Mustafa.Acar
// SPDX-License-Identifier: MIT
#include "bus/usb_can_session.hpp"
#include "fake_serial_port.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace canusb::bus;
using canusb::test::FakeSerialPort;
using namespace std::chrono_literals;

namespace {

const std::vector<uint8_t> kStdFrame = {0xAA, 0xC8, 0x23, 0x01, 1, 2, 3, 4, 5, 6, 7, 8, 0x55};

std::vector<uint8_t> frameWithId(uint16_t id)
{
    return {0xAA, 0xC1, static_cast<uint8_t>(id & 0xFF), static_cast<uint8_t>(id >> 8), 0x42, 0x55};
}

// Collects frames from the session thread.
class Sink {
public:
    void operator()(const Frame& f) {
        {
            std::lock_guard lock(m_);
            frames_.push_back(f);
        }
        cv_.notify_all();
    }

    bool waitFor(std::size_t n, std::chrono::milliseconds timeout = 2s) {
        std::unique_lock lock(m_);
        return cv_.wait_for(lock, timeout, [&] { return frames_.size() >= n; });
    }

    std::vector<Frame> frames() {
        std::lock_guard lock(m_);
        return frames_;
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::vector<Frame> frames_;
};

class UsbCanSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto port = std::make_unique<FakeSerialPort>();
        port_ = port.get();
        session_ = std::make_unique<UsbCanSession>(std::move(port));
        opts_.port = "/dev/ttyFAKE0";
        opts_.idle_sleep = 100us;
    }

    void TearDown() override { session_->disconnect(); }

    Sink sink_a_, sink_b_;             // declared first so they outlive session_
    FakeSerialPort* port_ {nullptr};   // owned by session_
    std::unique_ptr<UsbCanSession> session_;
    SessionOptions opts_;
};

} // namespace

TEST_F(UsbCanSessionTest, ConnectOpensPortAndWritesInitCommand)
{
    opts_.can_speed = 250000;
    ASSERT_TRUE(session_->connect(opts_));
    EXPECT_TRUE(session_->connected());
    EXPECT_TRUE(port_->isOpen());
    EXPECT_EQ(port_->port(), "/dev/ttyFAKE0");
    EXPECT_EQ(port_->baudrate(), 2000000u);
    EXPECT_EQ(port_->stopBits(), 2);

    const auto written = port_->written();
    ASSERT_EQ(written.size(), 1u);
    const InitCommand expected = encodeInitCommand(250000);
    EXPECT_EQ(written[0], std::vector<uint8_t>(expected.begin(), expected.end()));
}

TEST_F(UsbCanSessionTest, SecondConnectIsRejected)
{
    ASSERT_TRUE(session_->connect(opts_));
    EXPECT_FALSE(session_->connect(opts_));
    EXPECT_EQ(port_->openCount(), 1);
}

TEST_F(UsbCanSessionTest, OpenFailureLeavesNothingRunning)
{
    port_->failOpen(true);
    EXPECT_FALSE(session_->connect(opts_));
    EXPECT_FALSE(session_->connected());
    EXPECT_TRUE(port_->written().empty());
    session_->disconnect();
}

TEST_F(UsbCanSessionTest, InitWriteFailureClosesPort)
{
    port_->failWrite(true);
    EXPECT_FALSE(session_->connect(opts_));
    EXPECT_FALSE(session_->connected());
    EXPECT_FALSE(port_->isOpen());
}

TEST_F(UsbCanSessionTest, DisconnectWithoutConnectIsSafe)
{
    session_->disconnect();
    session_->disconnect();
    EXPECT_FALSE(session_->connected());
}

TEST_F(UsbCanSessionTest, DecodedFramesReachEveryObserver)
{
    Sink& a = sink_a_;
    Sink& b = sink_b_;
    session_->addObserver(std::ref(a));
    session_->addObserver(std::ref(b));
    ASSERT_TRUE(session_->connect(opts_));

    port_->feed(kStdFrame);
    ASSERT_TRUE(a.waitFor(1));
    ASSERT_TRUE(b.waitFor(1));

    const Frame f = a.frames().at(0);
    EXPECT_EQ(f.id, 0x123u);
    EXPECT_EQ(f.dlc, 8);
    EXPECT_EQ(f.data, (std::vector<uint8_t>{1, 2, 3, 4, 5, 6, 7, 8}));
    EXPECT_FALSE(f.extended);
    EXPECT_EQ(b.frames().size(), 1u);
}

TEST_F(UsbCanSessionTest, FramesSplitAcrossReadsAreReassembled)
{
    Sink& sink = sink_a_;
    session_->addObserver(std::ref(sink));
    port_->maxChunk(3);
    ASSERT_TRUE(session_->connect(opts_));

    std::vector<uint8_t> stream = {0x7F};
    stream.insert(stream.end(), kStdFrame.begin(), kStdFrame.end());
    auto ext = kStdFrame;
    ext[1] = 0xE8;
    stream.insert(stream.end(), ext.begin(), ext.end());
    port_->feed(stream);

    ASSERT_TRUE(sink.waitFor(2));
    const auto frames = sink.frames();
    ASSERT_EQ(frames.size(), 2u);
    EXPECT_FALSE(frames[0].extended);
    EXPECT_TRUE(frames[1].extended);
    EXPECT_EQ(frames[1].id, 0x123u);

    const auto s = session_->stats();
    EXPECT_EQ(s.frames, 2u);
    EXPECT_EQ(s.skipped_bytes, 1u);
    EXPECT_EQ(s.bytes_received, stream.size());
}

TEST_F(UsbCanSessionTest, RemovedObserverStopsReceiving)
{
    Sink& kept = sink_a_;
    Sink& removed = sink_b_;
    session_->addObserver(std::ref(kept));
    const auto id = session_->addObserver(std::ref(removed));
    EXPECT_TRUE(session_->removeObserver(id));
    EXPECT_FALSE(session_->removeObserver(id));
    ASSERT_TRUE(session_->connect(opts_));

    port_->feed(kStdFrame);
    ASSERT_TRUE(kept.waitFor(1));
    EXPECT_TRUE(removed.frames().empty());
}

TEST_F(UsbCanSessionTest, TransportFailureEndsSessionAndNotifies)
{
    std::mutex m;
    std::condition_variable cv;
    std::string reason;
    session_->addEndedObserver([&](const std::string& r) {
        {
            std::lock_guard lock(m);
            reason = r;
        }
        cv.notify_all();
    });
    ASSERT_TRUE(session_->connect(opts_));

    port_->failIo(true);
    {
        std::unique_lock lock(m);
        ASSERT_TRUE(cv.wait_for(lock, 2s, [&] { return !reason.empty(); }));
    }
    EXPECT_FALSE(session_->connected());

    // the dead loop is reaped and the port reopened on the next connect
    port_->failIo(false);
    ASSERT_TRUE(session_->connect(opts_));
    EXPECT_EQ(port_->openCount(), 2);
}

TEST_F(UsbCanSessionTest, DisconnectStopsLoopAndClosesPort)
{
    Sink& sink = sink_a_;
    session_->addObserver(std::ref(sink));
    ASSERT_TRUE(session_->connect(opts_));
    session_->disconnect();
    EXPECT_FALSE(session_->connected());
    EXPECT_FALSE(port_->isOpen());

    port_->feed(kStdFrame);
    std::this_thread::sleep_for(20ms);
    EXPECT_TRUE(sink.frames().empty());
    EXPECT_EQ(port_->pending(), kStdFrame.size());
}

TEST_F(UsbCanSessionTest, ObserverAddedFromCallbackSeesOnlyLaterFrames)
{
    bool added = false;
    session_->addObserver([this, &added](const Frame& f) {
        if (!added) {
            session_->addObserver(std::ref(sink_b_));
            added = true;
        }
        sink_a_(f);
    });
    ASSERT_TRUE(session_->connect(opts_));

    port_->feed(frameWithId(0x101));
    ASSERT_TRUE(sink_a_.waitFor(1));
    port_->feed(frameWithId(0x102));
    ASSERT_TRUE(sink_a_.waitFor(2));
    ASSERT_TRUE(sink_b_.waitFor(1));

    const auto late = sink_b_.frames();
    ASSERT_EQ(late.size(), 1u);
    EXPECT_EQ(late[0].id, 0x102u);
    EXPECT_EQ(session_->stats().observers, 2u);
    session_->disconnect();   // the first observer refers to locals
}

TEST_F(UsbCanSessionTest, DisconnectFromCallbackStopsSessionAndAllowsReconnect)
{
    std::atomic<bool> once {false};
    session_->addObserver([this, &once](const Frame& f) {
        if (!once.exchange(true)) session_->disconnect();
        sink_a_(f);
    });
    ASSERT_TRUE(session_->connect(opts_));

    port_->feed(kStdFrame);
    ASSERT_TRUE(sink_a_.waitFor(1));
    EXPECT_FALSE(session_->connected());

    ASSERT_TRUE(session_->connect(opts_));
    EXPECT_TRUE(session_->connected());
    EXPECT_EQ(port_->openCount(), 2);

    port_->feed(kStdFrame);
    ASSERT_TRUE(sink_a_.waitFor(2));
    session_->disconnect();
}

TEST_F(UsbCanSessionTest, ObserversChangeWhileFramesFlow)
{
    constexpr std::size_t kFrames = 2000;
    session_->addObserver(std::ref(sink_a_));
    ASSERT_TRUE(session_->connect(opts_));

    std::thread churn([this] {
        for (int i = 0; i < 200; ++i) {
            const auto id = session_->addObserver([](const Frame&) {});
            EXPECT_TRUE(session_->removeObserver(id));
        }
    });
    for (std::size_t i = 0; i < kFrames; ++i)
        port_->feed(frameWithId(static_cast<uint16_t>(i)));
    churn.join();

    ASSERT_TRUE(sink_a_.waitFor(kFrames, 10s));
    const auto frames = sink_a_.frames();
    ASSERT_EQ(frames.size(), kFrames);
    for (std::size_t i = 0; i < kFrames; ++i)
        EXPECT_EQ(frames[i].id, static_cast<uint32_t>(i));
    EXPECT_EQ(session_->stats().observers, 1u);
}

TEST_F(UsbCanSessionTest, ThrowingEndedObserverDoesNotStopOthers)
{
    std::mutex m;
    std::condition_variable cv;
    bool notified = false;
    session_->addEndedObserver([](const std::string&) {
        throw std::runtime_error("listener broke");
    });
    session_->addEndedObserver([&](const std::string&) {
        {
            std::lock_guard lock(m);
            notified = true;
        }
        cv.notify_all();
    });
    ASSERT_TRUE(session_->connect(opts_));

    port_->failIo(true);
    {
        std::unique_lock lock(m);
        ASSERT_TRUE(cv.wait_for(lock, 2s, [&] { return notified; }));
    }
    EXPECT_FALSE(session_->connected());

    port_->failIo(false);
    ASSERT_TRUE(session_->connect(opts_));
}
