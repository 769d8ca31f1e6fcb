/**
 * @file chunk_source.cpp
 * @brief Implementation of body re-slicing into upload parts
 */

#include <kcenon/blob/core/chunk_source.h>

#include <algorithm>
#include <exception>
#include <stdexcept>

namespace kcenon::blob {

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

auto stream_remaining(std::istream& stream) -> uint64_t {
    auto current = stream.tellg();
    if (current == std::istream::pos_type(-1)) {
        stream.clear();
        return 0;
    }
    stream.seekg(0, std::ios::end);
    auto end = stream.tellg();
    stream.seekg(current, std::ios::beg);
    if (end == std::istream::pos_type(-1) || !stream.good()) {
        stream.clear();
        stream.seekg(current, std::ios::beg);
        return 0;
    }
    return static_cast<uint64_t>(end - current);
}

}  // namespace

auto to_bytes(std::string_view text) -> byte_buffer {
    byte_buffer bytes(text.size());
    std::transform(text.begin(), text.end(), bytes.begin(),
                   [](char c) { return static_cast<std::byte>(c); });
    return bytes;
}

auto body_length(const blob_body& body) -> uint64_t {
    return std::visit(
        overloaded{
            [](const byte_buffer& b) -> uint64_t { return b.size(); },
            [](const std::string& s) -> uint64_t { return s.size(); },
            [](const std::shared_ptr<std::istream>& s) -> uint64_t {
                return s ? stream_remaining(*s) : 0;
            },
            [](const chunk_generator&) -> uint64_t { return 0; },
        },
        body);
}

// ============================================================================
// chunk_source::impl
// ============================================================================

struct chunk_source::impl {
    blob_body body;
    std::size_t part_size = 0;
    uint64_t total_size = 0;
    uint32_t produced = 0;

    // In-memory bodies are sliced in place
    std::size_t offset = 0;

    // Stream and generator bodies are staged here until a full part exists
    byte_buffer pending;
    bool exhausted = false;

    auto next_from_memory(const std::byte* data, std::size_t size)
        -> std::optional<byte_buffer> {
        if (offset >= size) {
            return std::nullopt;
        }
        std::size_t len = std::min(part_size, size - offset);
        byte_buffer out(data + offset, data + offset + len);
        offset += len;
        return out;
    }

    auto next_from_stream(std::istream& stream) -> result<std::optional<byte_buffer>> {
        byte_buffer out(part_size);
        std::size_t filled = 0;
        while (filled < part_size && !exhausted) {
            stream.read(reinterpret_cast<char*>(out.data() + filled),
                        static_cast<std::streamsize>(part_size - filled));
            filled += static_cast<std::size_t>(stream.gcount());
            if (stream.eof()) {
                exhausted = true;
            } else if (stream.fail()) {
                return unexpected(error{error_code::file_read_error, "stream read failed"});
            }
        }
        if (filled == 0) {
            return std::optional<byte_buffer>{};
        }
        out.resize(filled);
        return std::optional<byte_buffer>{std::move(out)};
    }

    auto next_from_generator(chunk_generator& generator) -> result<std::optional<byte_buffer>> {
        while (pending.size() < part_size && !exhausted) {
            std::optional<byte_buffer> piece;
            try {
                piece = generator();
            } catch (const std::exception& e) {
                return unexpected(error{error_code::file_read_error,
                                        std::string("body generator failed: ") + e.what()});
            }
            if (!piece) {
                exhausted = true;
                break;
            }
            pending.insert(pending.end(), piece->begin(), piece->end());
        }

        if (pending.empty()) {
            return std::optional<byte_buffer>{};
        }

        std::size_t len = std::min(part_size, pending.size());
        byte_buffer out(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(len));
        pending.erase(pending.begin(), pending.begin() + static_cast<std::ptrdiff_t>(len));
        return std::optional<byte_buffer>{std::move(out)};
    }
};

// ============================================================================
// chunk_source
// ============================================================================

chunk_source::chunk_source(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

chunk_source::chunk_source(chunk_source&&) noexcept = default;
auto chunk_source::operator=(chunk_source&&) noexcept -> chunk_source& = default;
chunk_source::~chunk_source() = default;

auto chunk_source::create(blob_body body, std::size_t part_size) -> result<chunk_source> {
    if (part_size == 0) {
        return unexpected(error{error_code::invalid_argument, "part size must be positive"});
    }
    if (auto* stream = std::get_if<std::shared_ptr<std::istream>>(&body); stream && !*stream) {
        return unexpected(error{error_code::invalid_argument, "body stream is null"});
    }
    if (auto* gen = std::get_if<chunk_generator>(&body); gen && !*gen) {
        return unexpected(error{error_code::invalid_argument, "body generator is empty"});
    }

    auto state = std::make_unique<impl>();
    state->total_size = body_length(body);
    state->body = std::move(body);
    state->part_size = part_size;
    return chunk_source(std::move(state));
}

auto chunk_source::next() -> result<std::optional<byte_buffer>> {
    result<std::optional<byte_buffer>> chunk = std::visit(
        overloaded{
            [this](const byte_buffer& b) -> result<std::optional<byte_buffer>> {
                return impl_->next_from_memory(b.data(), b.size());
            },
            [this](const std::string& s) -> result<std::optional<byte_buffer>> {
                return impl_->next_from_memory(reinterpret_cast<const std::byte*>(s.data()),
                                               s.size());
            },
            [this](std::shared_ptr<std::istream>& s) -> result<std::optional<byte_buffer>> {
                return impl_->next_from_stream(*s);
            },
            [this](chunk_generator& g) -> result<std::optional<byte_buffer>> {
                return impl_->next_from_generator(g);
            },
        },
        impl_->body);

    if (chunk.has_value() && chunk.value().has_value()) {
        ++impl_->produced;
    }
    return chunk;
}

auto chunk_source::total_size() const -> uint64_t {
    return impl_->total_size;
}

auto chunk_source::chunks_produced() const -> uint32_t {
    return impl_->produced;
}

auto chunk_source::part_size() const -> std::size_t {
    return impl_->part_size;
}

// ============================================================================
// read_prefix / chain_body
// ============================================================================

auto read_prefix(blob_body body, std::size_t limit) -> result<body_prefix> {
    body_prefix prefix;

    if (auto* bytes = std::get_if<byte_buffer>(&body)) {
        if (bytes->size() <= limit) {
            prefix.head = std::move(*bytes);
            prefix.complete = true;
        } else {
            prefix.rest = std::move(body);
        }
        return prefix;
    }
    if (auto* text = std::get_if<std::string>(&body)) {
        if (text->size() <= limit) {
            prefix.head = to_bytes(*text);
            prefix.complete = true;
        } else {
            prefix.rest = std::move(body);
        }
        return prefix;
    }

    if (auto* stream = std::get_if<std::shared_ptr<std::istream>>(&body)) {
        if (!*stream) {
            return unexpected(error{error_code::invalid_argument, "body stream is null"});
        }
        prefix.head.resize(limit);
        std::size_t filled = 0;
        while (filled < limit) {
            (*stream)->read(reinterpret_cast<char*>(prefix.head.data() + filled),
                            static_cast<std::streamsize>(limit - filled));
            filled += static_cast<std::size_t>((*stream)->gcount());
            if ((*stream)->eof()) {
                prefix.complete = true;
                break;
            }
            if ((*stream)->fail()) {
                return unexpected(error{error_code::file_read_error, "stream read failed"});
            }
        }
        prefix.head.resize(filled);
        prefix.rest = std::move(body);
        return prefix;
    }

    auto& generator = std::get<chunk_generator>(body);
    if (!generator) {
        return unexpected(error{error_code::invalid_argument, "body generator is empty"});
    }
    while (prefix.head.size() < limit) {
        std::optional<byte_buffer> piece;
        try {
            piece = generator();
        } catch (const std::exception& e) {
            return unexpected(error{error_code::file_read_error,
                                    std::string("body generator failed: ") + e.what()});
        }
        if (!piece) {
            prefix.complete = true;
            break;
        }
        prefix.head.insert(prefix.head.end(), piece->begin(), piece->end());
    }
    prefix.rest = std::move(body);
    return prefix;
}

auto chain_body(body_prefix prefix) -> result<blob_body> {
    if (prefix.complete) {
        return blob_body(std::move(prefix.head));
    }
    if (prefix.head.empty()) {
        return std::move(prefix.rest);
    }

    constexpr std::size_t read_block = 1024 * 1024;
    auto tail = chunk_source::create(std::move(prefix.rest), read_block);
    if (!tail) {
        return unexpected(tail.error());
    }

    struct chained {
        std::optional<byte_buffer> head;
        chunk_source tail;
    };
    auto state = std::make_shared<chained>(
        chained{std::move(prefix.head), std::move(tail.value())});

    return blob_body(chunk_generator([state]() -> std::optional<byte_buffer> {
        if (state->head) {
            auto head = std::move(*state->head);
            state->head.reset();
            return head;
        }
        auto chunk = state->tail.next();
        if (!chunk) {
            throw std::runtime_error(chunk.error().message);
        }
        return std::move(chunk.value());
    }));
}

}  // namespace kcenon::blob
