// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "mirror_block_client.hpp"

#include <fstream>
#include <stdexcept>
#include <string>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/endian/conversion.hpp>

#include <erafetch/e2store/era1_builder.hpp>
#include <erafetch/e2store/era1_reader.hpp>
#include <erafetch/e2store/snappy_codec.hpp>
#include <erafetch/infra/common/log.hpp>
#include <erafetch/infra/concurrency/spawn.hpp>

#include "disk_writer.hpp"

namespace erafetch::fetch {

namespace {

    //! Streams the blocks of a decoded era1 file, yielding to the executor between blocks
    class MirrorBlockStream : public BlockStream {
      public:
        explicit MirrorBlockStream(e2store::Era1File file) : file_{std::move(file)} {}

        Task<std::optional<BlockRecord>> next() override {
            co_await boost::asio::post(co_await boost::asio::this_coro::executor, boost::asio::use_awaitable);
            if (closed_ || position_ == file_.blocks.size()) {
                co_return std::nullopt;
            }
            auto& block{file_.blocks[position_]};
            BlockRecord record{
                .sequence = position_,
                .number = block.number,
                .payload = {
                    .header = std::move(block.header),
                    .body = std::move(block.body),
                    .receipts = std::move(block.receipts),
                    .total_difficulty = e2store::total_difficulty_to_be(block.total_difficulty),
                },
            };
            ++position_;
            co_return record;
        }

        void close() override { closed_ = true; }

      private:
        e2store::Era1File file_;
        uint64_t position_{0};
        bool closed_{false};
    };

    uint64_t read_expected_block_count(const std::filesystem::path& path) {
        std::error_code ec;
        const auto size{std::filesystem::file_size(path, ec)};
        if (ec) {
            throw TransientStreamError{"mirror file " + path.string() + " not available: " + ec.message()};
        }
        std::ifstream file{path, std::ios::binary};
        if (!file.is_open() || size < e2store::kHeaderSize + 16) {
            throw ProtocolError{"mirror file " + path.string() + " is not an era1 file"};
        }

        // Read the count ending the BlockIndex entry, then the whole entry to validate it
        uint8_t count_bytes[8];
        file.seekg(static_cast<std::streamoff>(size - 8));
        file.read(reinterpret_cast<char*>(count_bytes), sizeof(count_bytes));
        const uint64_t count{boost::endian::load_little_u64(count_bytes)};
        if (!file || count > (size - e2store::kHeaderSize - 16) / 8) {
            throw ProtocolError{"mirror file " + path.string() + " has a corrupted block index"};
        }
        const uint64_t index_size{e2store::kHeaderSize + 16 + 8 * count};
        Bytes index(index_size, '\0');
        file.seekg(static_cast<std::streamoff>(size - index_size));
        file.read(reinterpret_cast<char*>(index.data()), static_cast<std::streamsize>(index_size));
        if (!file) {
            throw TransientStreamError{"cannot read " + path.string()};
        }
        try {
            return e2store::read_block_count(index);
        } catch (const e2store::DecodingError& ex) {
            throw ProtocolError{path.string() + ": " + ex.what()};
        }
    }

}  // namespace

MirrorBlockClient::MirrorBlockClient(std::filesystem::path mirror_dir, boost::asio::any_io_executor blocking_executor)
    : mirror_dir_{std::move(mirror_dir)}, blocking_executor_{std::move(blocking_executor)} {}

std::filesystem::path MirrorBlockClient::mirror_path(EraIndex era) const {
    return mirror_dir_ / DiskWriter::era_file_name(era);
}

Task<std::unique_ptr<BlockStream>> MirrorBlockClient::open(EraIndex era, const Credential& /*credential*/) {
    const auto path{mirror_path(era)};
    auto file = co_await concurrency::spawn_task(blocking_executor_, [path]() -> Task<e2store::Era1File> {
        if (!std::filesystem::exists(path)) {
            throw TransientStreamError{"mirror file " + path.string() + " not available"};
        }
        Bytes content;
        try {
            content = e2store::read_file(path);
        } catch (const std::runtime_error& ex) {
            throw TransientStreamError{ex.what()};
        }
        try {
            co_return e2store::read_era1(content);
        } catch (const e2store::DecodingError& ex) {
            throw ProtocolError{path.string() + ": " + ex.what()};
        } catch (const snappy::SnappyError& ex) {
            throw ProtocolError{path.string() + ": " + ex.what()};
        }
    });
    ERAF_TRACE_M("MirrorBlockClient", {"era", std::to_string(era), "blocks", std::to_string(file.blocks.size())});
    co_return std::make_unique<MirrorBlockStream>(std::move(file));
}

Task<uint64_t> MirrorBlockClient::expected_block_count(EraIndex era) {
    const auto path{mirror_path(era)};
    co_return co_await concurrency::spawn_task(blocking_executor_, [path]() -> Task<uint64_t> {
        co_return read_expected_block_count(path);
    });
}

}  // namespace erafetch::fetch
