#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include "errors.hpp"
#include "transfer.hpp"
#include "test_support.hpp"

using namespace testing_support;
using protocol::CommandType;
using protocol::Message;
using transfer::Phase;

namespace {

std::vector<Message> chunks_of(const std::vector<uint8_t>& bytes) {
    std::vector<Message> out;
    uint32_t total = protocol::chunk_count(bytes.size());
    for (uint32_t i = 0; i < total; ++i) {
        auto first = bytes.begin() + static_cast<std::ptrdiff_t>(i * protocol::CHUNK_SIZE);
        auto last = bytes.begin() + static_cast<std::ptrdiff_t>(std::min<std::size_t>((i + 1) * protocol::CHUNK_SIZE, bytes.size()));
        out.push_back(Message::file_chunk(std::vector<uint8_t>(first, last), i, total));
    }
    return out;
}

class ReceiverTest : public ::testing::Test {
protected:
    ReceiverTest() {
        cfg.finalize_watchdog = std::chrono::milliseconds(20);
        sink = std::make_shared<MemorySink>();
        channel = std::make_shared<RecordingChannel>(io);
    }

    transfer::TransferCallbacks callbacks() {
        transfer::TransferCallbacks cb;
        cb.on_state = [this](const transfer::TransferState& state) { states.push_back(state); };
        cb.on_status = [this](const std::string& text) { statuses.push_back(text); };
        cb.on_error = [this](const std::runtime_error& error) { error_texts.push_back(error.what()); };
        return cb;
    }

    std::unique_ptr<transfer::TransferReceiver> make_receiver() {
        auto receiver = std::make_unique<transfer::TransferReceiver>(io, cfg, sink, callbacks());
        receiver->attach(channel);
        return receiver;
    }

    void feed(transfer::TransferReceiver& receiver, const std::string& name, const std::vector<uint8_t>& bytes) {
        receiver.on_message(Message::file_metadata({name, bytes.size(), "application/octet-stream"}));
        for (const auto& chunk : chunks_of(bytes)) {
            receiver.on_message(chunk);
        }
    }

    bool failed_with(const std::string& text) const {
        for (const auto& e : error_texts) {
            if (e.find(text) != std::string::npos) return true;
        }
        return false;
    }

    boost::asio::io_context io;
    config::Config cfg;
    std::shared_ptr<MemorySink> sink;
    std::shared_ptr<RecordingChannel> channel;
    std::vector<transfer::TransferState> states;
    std::vector<std::string> statuses;
    std::vector<std::string> error_texts;
};

} // namespace

TEST_F(ReceiverTest, ReassemblesAndAcknowledges) {
    auto receiver = make_receiver();
    auto bytes = make_bytes(50000);

    feed(*receiver, "a.bin", bytes);
    receiver->on_message(Message::file_complete());

    ASSERT_EQ(sink->deliveries.size(), 1u);
    EXPECT_EQ(sink->deliveries[0].bytes, bytes);
    EXPECT_EQ(sink->deliveries[0].meta.name, "a.bin");
    EXPECT_EQ(receiver->state().phase, Phase::COMPLETED);
    EXPECT_EQ(receiver->state().progress_percent, 100);
    EXPECT_EQ(receiver->saved_path(), "memory://a.bin");
    EXPECT_EQ(statuses.front(), "Receiving file: a.bin (48.8KB)");
    EXPECT_EQ(statuses.back(), "File downloaded successfully! Saved to memory://a.bin");

    ASSERT_EQ(channel->sent.size(), 1u);
    EXPECT_TRUE(channel->sent[0].is_received_ack());

    // Watchdog was disarmed by the completion marker
    io.run();
    EXPECT_EQ(sink->deliveries.size(), 1u);
    EXPECT_EQ(channel->sent.size(), 1u);
}

TEST_F(ReceiverTest, ReportsProgressPerChunk) {
    auto receiver = make_receiver();
    feed(*receiver, "a.bin", make_bytes(50000));

    std::vector<int> progress;
    for (const auto& s : states) {
        EXPECT_EQ(s.phase, Phase::RECEIVING);
        progress.push_back(s.progress_percent);
    }
    EXPECT_EQ(progress, (std::vector<int>{0, 25, 50, 75, 100}));
    EXPECT_EQ(receiver->received_count(), 4u);
    EXPECT_EQ(receiver->total_chunks(), 4u);
}

TEST_F(ReceiverTest, ChunkWithoutDataIsIgnored) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"a.bin", 100, ""}));

    Message chunk = Message::file_chunk({}, 0, 1);
    chunk.data.reset();
    receiver->on_message(chunk);

    EXPECT_EQ(receiver->received_count(), 0u);
    EXPECT_EQ(receiver->state().phase, Phase::RECEIVING);
    EXPECT_EQ(receiver->state().progress_percent, 0);
    EXPECT_TRUE(error_texts.empty());
}

TEST_F(ReceiverTest, NewMetadataDiscardsPartialFile) {
    auto receiver = make_receiver();
    auto first = make_bytes(50000, 1);
    auto second = make_bytes(20000, 2);

    receiver->on_message(Message::file_metadata({"first.bin", first.size(), ""}));
    auto first_chunks = chunks_of(first);
    receiver->on_message(first_chunks[0]);
    receiver->on_message(first_chunks[1]);
    ASSERT_EQ(receiver->state().progress_percent, 50);

    receiver->on_message(Message::file_metadata({"second.bin", second.size(), ""}));
    EXPECT_EQ(receiver->received_count(), 0u);
    EXPECT_EQ(receiver->state().progress_percent, 0);
    EXPECT_EQ(receiver->metadata().name, "second.bin");

    for (const auto& chunk : chunks_of(second)) {
        receiver->on_message(chunk);
    }
    receiver->on_message(Message::file_complete());

    ASSERT_EQ(sink->deliveries.size(), 1u);
    EXPECT_EQ(sink->deliveries[0].meta.name, "second.bin");
    EXPECT_EQ(sink->deliveries[0].bytes, second);
}

TEST_F(ReceiverTest, WatchdogFinalizesWithoutMarker) {
    auto receiver = make_receiver();
    auto bytes = make_bytes(30000);
    feed(*receiver, "late.bin", bytes);
    EXPECT_TRUE(sink->deliveries.empty());

    io.run();

    ASSERT_EQ(sink->deliveries.size(), 1u);
    EXPECT_EQ(sink->deliveries[0].bytes, bytes);
    EXPECT_EQ(receiver->state().phase, Phase::COMPLETED);

    // The marker arriving afterwards does not deliver twice
    receiver->on_message(Message::file_complete());
    EXPECT_EQ(sink->deliveries.size(), 1u);
    EXPECT_TRUE(error_texts.empty());
}

TEST_F(ReceiverTest, WatchdogDoesNotFireForReplacedFile) {
    auto receiver = make_receiver();
    feed(*receiver, "old.bin", make_bytes(100));
    receiver->on_message(Message::file_metadata({"new.bin", 100, ""}));

    io.run();

    EXPECT_TRUE(sink->deliveries.empty());
    EXPECT_EQ(receiver->state().phase, Phase::RECEIVING);
}

TEST_F(ReceiverTest, WatchdogDoesNotFireAfterReset) {
    auto receiver = make_receiver();
    feed(*receiver, "a.bin", make_bytes(100));
    receiver->reset();

    io.run();

    EXPECT_TRUE(sink->deliveries.empty());
    EXPECT_EQ(receiver->state().phase, Phase::IDLE);
}

TEST_F(ReceiverTest, MarkerWithoutDataFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"a.bin", 100, ""}));
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("No data received"));
    EXPECT_TRUE(sink->deliveries.empty());
    EXPECT_TRUE(channel->sent.empty());
}

TEST_F(ReceiverTest, MarkerBeforeAnythingFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("No data received"));
}

TEST_F(ReceiverTest, EmptyAssemblyFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"zero.bin", 0, ""}));
    receiver->on_message(Message::file_chunk({}, 0, 1));
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("Empty file"));
}

TEST_F(ReceiverTest, GapFailsInsteadOfDelivering) {
    auto receiver = make_receiver();
    auto chunks = chunks_of(make_bytes(40000));
    receiver->on_message(Message::file_metadata({"gap.bin", 40000, ""}));
    receiver->on_message(chunks[0]);
    receiver->on_message(chunks[2]);
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("Missing chunks (2 of 3 received)"));
    EXPECT_TRUE(sink->deliveries.empty());
}

TEST_F(ReceiverTest, SizeMismatchFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"a.bin", 100, ""}));
    receiver->on_message(Message::file_chunk(make_bytes(50), 0, 1));
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("Size mismatch"));
}

TEST_F(ReceiverTest, DuplicateChunkIsNotCounted) {
    auto receiver = make_receiver();
    auto chunks = chunks_of(make_bytes(50000));
    receiver->on_message(Message::file_metadata({"a.bin", 50000, ""}));
    receiver->on_message(chunks[0]);
    receiver->on_message(chunks[0]);

    EXPECT_EQ(receiver->received_count(), 1u);
    EXPECT_EQ(receiver->state().progress_percent, 25);
    EXPECT_TRUE(error_texts.empty());
}

TEST_F(ReceiverTest, OutOfRangeIndexFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"a.bin", 50000, ""}));
    receiver->on_message(Message::file_chunk({1, 2}, 4, 4));

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("out of range"));
}

TEST_F(ReceiverTest, ChangingTotalFails) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_metadata({"a.bin", 50000, ""}));
    receiver->on_message(Message::file_chunk({1}, 0, 4));
    receiver->on_message(Message::file_chunk({2}, 1, 5));

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("Chunk count changed"));
}

TEST_F(ReceiverTest, ChunksAfterFailureAreDropped) {
    auto receiver = make_receiver();
    auto chunks = chunks_of(make_bytes(50000));
    receiver->on_message(Message::file_metadata({"a.bin", 50000, ""}));
    receiver->on_message(Message::file_chunk({1}, 9, 4));
    ASSERT_EQ(receiver->state().phase, Phase::FAILED);

    receiver->on_message(chunks[0]);
    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_EQ(receiver->received_count(), 0u);
}

TEST_F(ReceiverTest, ChunkBeforeMetadataStillAssembles) {
    auto receiver = make_receiver();
    receiver->on_message(Message::file_chunk({1, 2, 3}, 0, 1));
    receiver->on_message(Message::file_complete());

    ASSERT_EQ(sink->deliveries.size(), 1u);
    EXPECT_EQ(sink->deliveries[0].meta.name, "downloaded_file");
    EXPECT_EQ(sink->deliveries[0].meta.mime_type, "application/octet-stream");
    EXPECT_EQ(sink->deliveries[0].bytes, (std::vector<uint8_t>{1, 2, 3}));
}

TEST_F(ReceiverTest, NoAckOnClosedChannel) {
    auto receiver = make_receiver();
    channel->open = false;

    feed(*receiver, "a.bin", make_bytes(100));
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::COMPLETED);
    EXPECT_TRUE(channel->sent.empty());
}

TEST_F(ReceiverTest, SinkFailureFailsTransfer) {
    auto receiver = make_receiver();
    sink->fail = true;

    feed(*receiver, "a.bin", make_bytes(100));
    receiver->on_message(Message::file_complete());

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("disk full"));
    EXPECT_TRUE(channel->sent.empty());
}

TEST_F(ReceiverTest, InterruptedAbortOnlyFailsInFlight) {
    auto receiver = make_receiver();
    receiver->abort(true);
    EXPECT_TRUE(error_texts.empty());

    receiver->on_message(Message::file_metadata({"a.bin", 50000, ""}));
    receiver->abort(true);

    EXPECT_EQ(receiver->state().phase, Phase::FAILED);
    EXPECT_TRUE(failed_with("interrupted"));
}
