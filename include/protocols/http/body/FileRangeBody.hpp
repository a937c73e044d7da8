#pragma once

#include "storage/FileHandle.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/optional.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <memory>
#include <system_error>
#include <utility>

namespace rh::protocols::http::body {

// Beast body that serializes [offset, offset + length) of a stored file.
// Reads happen lazily, one chunk per serializer pull, through the handle's pread.
struct FileRangeBody {
    class value_type {
    public:
        value_type() = default;

        void reset(std::shared_ptr<storage::FileHandle> handle, const uint64_t offset, const uint64_t length) {
            handle_ = std::move(handle);
            offset_ = offset;
            length_ = length;
        }

        [[nodiscard]] bool is_open() const noexcept { return static_cast<bool>(handle_); }
        [[nodiscard]] uint64_t size() const noexcept { return length_; }
        [[nodiscard]] uint64_t offset() const noexcept { return offset_; }
        [[nodiscard]] const std::shared_ptr<storage::FileHandle>& handle() const noexcept { return handle_; }

    private:
        std::shared_ptr<storage::FileHandle> handle_;
        uint64_t offset_{0};
        uint64_t length_{0};
    };

    static uint64_t size(const value_type& body) { return body.size(); }

    class writer {
    public:
        using const_buffers_type = boost::asio::const_buffer;

        static constexpr std::size_t CHUNK_SIZE = 64 * 1024;

        template<bool isRequest, class Fields>
        writer(boost::beast::http::header<isRequest, Fields>&, value_type& b)
            : body_(b), pos_(b.offset()), remain_(b.size()) {}

        void init(boost::beast::error_code& ec) {
            if (!body_.is_open() && remain_ > 0) ec = boost::beast::http::error::short_read;
            else ec = {};
        }

        boost::optional<std::pair<const_buffers_type, bool>> get(boost::beast::error_code& ec) {
            const auto amount = static_cast<std::size_t>(std::min<uint64_t>(remain_, buf_->size()));
            if (amount == 0) {
                ec = {};
                return boost::none;
            }

            std::size_t n = 0;
            try {
                n = body_.handle()->readAt(pos_, buf_->data(), amount);
            } catch (const std::system_error& e) {
                ec = boost::beast::error_code(e.code().value(), boost::system::generic_category());
                return boost::none;
            }

            // File shrank underneath us
            if (n == 0) {
                ec = boost::beast::http::error::short_read;
                return boost::none;
            }

            pos_ += n;
            remain_ -= n;
            ec = {};
            return {{const_buffers_type{buf_->data(), n}, remain_ > 0}};
        }

    private:
        value_type& body_;
        uint64_t pos_;
        uint64_t remain_;
        std::unique_ptr<std::array<char, CHUNK_SIZE>> buf_ = std::make_unique<std::array<char, CHUNK_SIZE>>();
    };
};

}
