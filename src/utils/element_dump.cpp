#include "jsonb/utils/element_dump.hpp"

#include "jsonb/codec/error.hpp"
#include "jsonb/codec/header.hpp"
#include "jsonb/codec/types.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace jsonb::utils {
namespace {

using jsonb::codec::ElementType;
using jsonb::codec::Header;

struct DumpContext final {
    std::ostringstream oss;
    ElementDumpOptions options{};
    // bytes 在整个输入中的起始偏移，用于输出绝对偏移。
    std::size_t base{0};
};

void append_payload_(std::ostringstream &oss,
                     jsonb::core::bytes_view payload,
                     std::size_t max_bytes) {
    const std::size_t n =
        (max_bytes == 0 ? payload.size() : std::min(payload.size(), max_bytes));
    oss << " \"";
    for (std::size_t i = 0; i < n; ++i) {
        const auto c = payload[i];
        if (c == '\\' || c == '"') {
            oss << '\\' << static_cast<char>(c);
        } else if (c >= 0x20 && c <= 0x7E) {
            oss << static_cast<char>(c);
        } else {
            oss << "\\x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::dec;
        }
    }
    if (n < payload.size()) {
        oss << "...";
    }
    oss << '"';
}

void append_error_(DumpContext &ctx, std::size_t offset, std::size_t depth,
                   const std::error_code &ec) {
    ctx.oss << std::setw(4) << std::setfill('0') << std::hex << offset << std::dec
            << ": " << std::string(depth * ctx.options.indent_spaces, ' ')
            << "<error: " << ec.message() << ">\n";
}

// 列出 bytes 中的连续元素；返回 false 表示遇到错误已停止。
bool dump_sequence_(DumpContext &ctx, jsonb::core::bytes_view bytes,
                    std::size_t base, std::size_t depth) {
    std::size_t pos = 0;
    while (pos < bytes.size()) {
        const auto offset = base + pos;
        Header h;
        const auto ec = jsonb::codec::decode_header(bytes.subspan(pos), h);
        if (ec) {
            append_error_(ctx, offset, depth, ec);
            return false;
        }

        ctx.oss << std::setw(4) << std::setfill('0') << std::hex << offset
                << std::dec << ": "
                << std::string(depth * ctx.options.indent_spaces, ' ')
                << jsonb::codec::element_type_name(h.type)
                << " hdr=" << h.header_size << " size=" << h.payload_size;

        const auto available = bytes.size() - pos - h.header_size;
        if (h.payload_size > available) {
            ctx.oss << '\n';
            append_error_(ctx, offset, depth,
                          jsonb::codec::make_error_code(
                              depth == 0
                                  ? jsonb::codec::errc::truncated
                                  : jsonb::codec::errc::malformed_composite));
            return false;
        }
        const auto payload = bytes.subspan(pos + h.header_size, h.payload_size);

        if (jsonb::codec::is_reserved(h.type)) {
            ctx.oss << '\n';
            append_error_(ctx, offset, depth,
                          jsonb::codec::make_error_code(
                              jsonb::codec::errc::unexpected_type));
            return false;
        }

        if (jsonb::codec::is_composite(h.type)) {
            ctx.oss << '\n';
            if (depth + 1 < ctx.options.max_depth) {
                if (!dump_sequence_(ctx, payload, offset + h.header_size,
                                    depth + 1)) {
                    return false;
                }
            }
        } else {
            if (h.payload_size != 0) {
                append_payload_(ctx.oss, payload, ctx.options.max_payload_bytes);
            }
            ctx.oss << '\n';
        }

        pos += h.header_size + h.payload_size;
    }
    return true;
}

} // namespace

std::string dump_elements(jsonb::core::bytes_view bytes,
                          ElementDumpOptions options) {
    DumpContext ctx;
    ctx.options = options;
    dump_sequence_(ctx, bytes, 0, 0);
    return ctx.oss.str();
}

} // namespace jsonb::utils
