// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "fake_block_client.hpp"

#include <algorithm>
#include <string>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/system/system_error.hpp>

#include <erafetch/e2store/era1_builder.hpp>

namespace erafetch::fetch::test_util {

using boost::asio::use_awaitable;

BlockPayload make_payload(EraIndex era, uint64_t sequence) {
    const uint64_t number{era * e2store::kBlocksPerEra + sequence};
    const auto tag{std::to_string(era) + ":" + std::to_string(sequence)};
    BlockPayload payload;
    payload.header = Bytes{reinterpret_cast<const uint8_t*>("header/"), 7};
    payload.header.append(reinterpret_cast<const uint8_t*>(tag.data()), tag.size());
    payload.body = Bytes(static_cast<size_t>(16 + sequence % 32), static_cast<uint8_t>(number & 0xff));
    payload.receipts = Bytes{reinterpret_cast<const uint8_t*>("receipts/"), 9};
    payload.receipts.append(reinterpret_cast<const uint8_t*>(tag.data()), tag.size());
    // total difficulty grows with the block number, big-endian without leading zeros
    const uint64_t difficulty{(number + 1) * 131'072};
    for (int shift{56}; shift >= 0; shift -= 8) {
        const auto byte{static_cast<uint8_t>(difficulty >> shift)};
        if (byte != 0 || !payload.total_difficulty.empty()) {
            payload.total_difficulty.push_back(byte);
        }
    }
    return payload;
}

class FakeBlockStream : public BlockStream {
  public:
    FakeBlockStream(FakeBlockClient& client, boost::asio::any_io_executor executor, EraIndex era,
                    std::optional<Fault> fault)
        : client_{client}, timer_{std::move(executor)}, era_{era}, fault_{fault} {}

    ~FakeBlockStream() override { close(); }

    Task<std::optional<BlockRecord>> next() override {
        if (closed_) co_return std::nullopt;

        const bool stall{fault_ && fault_->kind == Fault::Kind::kStallAt && fault_->at == position_};
        if (stall || client_.block_delay_.count() > 0) {
            if (stall) {
                timer_.expires_at(boost::asio::steady_timer::time_point::max());
            } else {
                timer_.expires_after(client_.block_delay_);
            }
            // a closed stream cancels the timer and ends
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(use_awaitable, ec));
            if (ec || closed_) co_return std::nullopt;
        } else {
            co_await boost::asio::post(co_await boost::asio::this_coro::executor, use_awaitable);
            if (closed_) co_return std::nullopt;
        }

        const uint64_t expected{client_.blocks_per_era_};
        uint64_t end{expected};
        if (fault_) {
            switch (fault_->kind) {
                case Fault::Kind::kTransientAt:
                    if (position_ == fault_->at) {
                        throw boost::system::system_error{make_error_code(boost::system::errc::connection_reset)};
                    }
                    break;
                case Fault::Kind::kShortAfter:
                    end = std::min(end, fault_->at);
                    break;
                case Fault::Kind::kExtraBlock:
                    end = expected + 1;
                    break;
                default:
                    break;
            }
        }
        if (position_ >= end) co_return std::nullopt;

        uint64_t sequence{position_};
        if (fault_ && fault_->kind == Fault::Kind::kOutOfOrderAt && fault_->at == position_) {
            ++sequence;
        }
        ++position_;
        co_return BlockRecord{
            .sequence = sequence,
            .number = era_ * e2store::kBlocksPerEra + sequence,
            .payload = make_payload(era_, sequence),
        };
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        timer_.cancel();
        client_.on_stream_closed();
    }

  private:
    FakeBlockClient& client_;
    boost::asio::steady_timer timer_;
    EraIndex era_;
    std::optional<Fault> fault_;
    uint64_t position_{0};
    bool closed_{false};
};

Task<std::unique_ptr<BlockStream>> FakeBlockClient::open(EraIndex era, const Credential& credential) {
    auto executor = co_await boost::asio::this_coro::executor;
    co_await boost::asio::post(executor, use_awaitable);

    const uint32_t attempt{++open_counts_[era]};
    ++total_open_count_;

    std::optional<Fault> fault;
    if (const auto it{faults_.find({era, attempt})}; it != faults_.end()) {
        fault = it->second;
    } else if (const auto persistent_it{persistent_faults_.find(era)}; persistent_it != persistent_faults_.end()) {
        fault = persistent_it->second;
    }
    if ((fault && fault->kind == Fault::Kind::kAuthOnOpen) ||
        (required_token_ && credential.token() != *required_token_)) {
        throw AuthError{"era " + std::to_string(era) + ": credential rejected"};
    }

    ++open_streams_;
    max_open_streams_ = std::max(max_open_streams_, open_streams_);
    co_return std::make_unique<FakeBlockStream>(*this, executor, era, fault);
}

uint32_t FakeBlockClient::open_count(EraIndex era) const {
    const auto it{open_counts_.find(era)};
    return it != open_counts_.end() ? it->second : 0;
}

void FakeBlockClient::on_stream_closed() {
    --open_streams_;
    ++closed_streams_;
}

}  // namespace erafetch::fetch::test_util
