// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "stream_session.hpp"

#include <exception>
#include <string>

#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/system/system_error.hpp>

#include <erafetch/infra/common/ensure.hpp>
#include <erafetch/infra/common/log.hpp>

namespace erafetch::fetch {

namespace {

    //! Closes the stream when the session goes out of scope
    class StreamCloser {
      public:
        explicit StreamCloser(BlockStream& stream) : stream_{stream} {}
        ~StreamCloser() { stream_.close(); }

        StreamCloser(const StreamCloser&) = delete;
        StreamCloser& operator=(const StreamCloser&) = delete;

      private:
        BlockStream& stream_;
    };

    //! Watchdog closing the stream if a read does not complete in time
    struct ReadDeadline {
        explicit ReadDeadline(const boost::asio::any_io_executor& executor) : timer{executor} {}

        boost::asio::steady_timer timer;
        bool active{true};
        bool expired{false};
    };

}  // namespace

StreamSession::StreamSession(BlockStreamClient& client,
                             EraIndex era,
                             const Credential& credential,
                             concurrency::CancellationToken& cancellation_token,
                             std::optional<std::chrono::milliseconds> read_timeout)
    : client_{client},
      era_{era},
      credential_{credential},
      cancellation_token_{cancellation_token},
      read_timeout_{read_timeout} {}

Task<void> StreamSession::run(std::vector<BlockRecord>& records) {
    ensure_pre_condition(records.empty(), [&]() { return "era " + std::to_string(era_) + ": records not empty"; });
    cancellation_token_.throw_if_cancelled();

    // Classify collaborator failures: exceptions cannot be handled with co_await inside a catch block,
    // so the outcome is captured and rethrown once classified
    std::exception_ptr failure;
    try {
        const uint64_t expected_count{co_await client_.expected_block_count(era_)};
        auto stream{co_await client_.open(era_, credential_)};
        ensure(stream != nullptr, "BlockStreamClient::open returned null stream");

        const StreamCloser closer{*stream};
        const auto registration{cancellation_token_.on_cancel([&stream]() { stream->close(); })};
        co_await ingest(*stream, expected_count, records);
    } catch (const FetchError&) {
        failure = std::current_exception();
    } catch (const boost::system::system_error& ex) {
        if (cancellation_token_.is_cancelled() || concurrency::is_cancellation(ex)) {
            throw concurrency::make_cancellation_error();
        }
        failure = std::make_exception_ptr(TransientStreamError{"era " + std::to_string(era_) + ": " + ex.what()});
    } catch (const std::logic_error&) {
        throw;
    } catch (const std::exception& ex) {
        failure = std::make_exception_ptr(ProtocolError{"era " + std::to_string(era_) + ": " + ex.what()});
    }
    if (failure) {
        // A stream interrupted by cancellation may surface as any failure
        cancellation_token_.throw_if_cancelled();
        std::rethrow_exception(failure);
    }
}

Task<void> StreamSession::ingest(BlockStream& stream, uint64_t expected_count, std::vector<BlockRecord>& records) {
    while (true) {
        auto record{co_await next_record(stream)};
        cancellation_token_.throw_if_cancelled();
        if (!record) {
            if (records.size() < expected_count) {
                throw ShortStreamError{"era " + std::to_string(era_) + ": stream ended after " +
                                       std::to_string(records.size()) + " of " + std::to_string(expected_count) +
                                       " blocks"};
            }
            break;
        }
        if (records.size() == expected_count) {
            throw ProtocolError{"era " + std::to_string(era_) + ": unexpected block beyond the expected count " +
                                std::to_string(expected_count)};
        }
        if (record->sequence != records.size()) {
            throw ProtocolError{"era " + std::to_string(era_) + ": out-of-order block, expected sequence " +
                                std::to_string(records.size()) + " got " + std::to_string(record->sequence)};
        }
        records.push_back(std::move(*record));
    }
    ERAF_TRACE_M("StreamSession", {"era", std::to_string(era_), "blocks", std::to_string(records.size())});
}

Task<std::optional<BlockRecord>> StreamSession::next_record(BlockStream& stream) {
    if (!read_timeout_) {
        co_return co_await stream.next();
    }

    auto executor = co_await boost::asio::this_coro::executor;
    auto deadline = std::make_shared<ReadDeadline>(executor);
    deadline->timer.expires_after(*read_timeout_);
    deadline->timer.async_wait([deadline, &stream](const boost::system::error_code& ec) {
        if (ec || !deadline->active) return;
        deadline->expired = true;
        stream.close();
    });

    std::optional<BlockRecord> record;
    std::exception_ptr read_failure;
    try {
        record = co_await stream.next();
    } catch (...) {
        // the watchdog must be disarmed before the failure leaves this frame
        read_failure = std::current_exception();
    }
    deadline->active = false;
    deadline->timer.cancel();

    if (deadline->expired) {
        throw TransientStreamError{"era " + std::to_string(era_) + ": no block received within " +
                                   std::to_string(read_timeout_->count()) + "ms"};
    }
    if (read_failure) {
        std::rethrow_exception(read_failure);
    }
    co_return record;
}

}  // namespace erafetch::fetch
