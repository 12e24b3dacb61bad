#include "subject_reader.hpp"
#include "diagnostics.hpp"
#include <fstream>
#include <iostream>
#include <iterator>
#include <vector>
#include <zlib.h>

namespace rexbind {
namespace subject_reader {

// windowBits for gzip framing (15 + 16)
static constexpr int gzip_window_bits = 15 + 16;

static std::string zlib_message(const z_stream& strm, int rc) {
    if (strm.msg != nullptr) return strm.msg;
    return "zlib error " + std::to_string(rc);
}

bool is_gzip(std::string_view data) {
    return data.size() >= 2 &&
           static_cast<unsigned char>(data[0]) == 0x1f &&
           static_cast<unsigned char>(data[1]) == 0x8b;
}

std::string inflate_gzip(std::string_view data) {
    z_stream strm{};
    int rc = inflateInit2(&strm, gzip_window_bits);
    if (rc != Z_OK) {
        throw subject_error("cannot initialize gzip decoder: " + zlib_message(strm, rc));
    }

    std::string output;
    std::vector<unsigned char> buffer(64 * 1024);
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    do {
        strm.next_out = buffer.data();
        strm.avail_out = static_cast<uInt>(buffer.size());
        rc = inflate(&strm, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            std::string message = zlib_message(strm, rc);
            inflateEnd(&strm);
            throw subject_error("corrupt gzip data: " + message);
        }
        output.append(reinterpret_cast<const char*>(buffer.data()), buffer.size() - strm.avail_out);
        if (rc == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw subject_error("truncated gzip data");
        }
    } while (rc != Z_STREAM_END);

    inflateEnd(&strm);
    return output;
}

std::string deflate_gzip(std::string_view data) {
    z_stream strm{};
    int rc = deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, gzip_window_bits, 8, Z_DEFAULT_STRATEGY);
    if (rc != Z_OK) {
        throw subject_error("cannot initialize gzip encoder: " + zlib_message(strm, rc));
    }

    std::vector<unsigned char> compressed(deflateBound(&strm, static_cast<uLong>(data.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());
    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());
    rc = deflate(&strm, Z_FINISH);
    if (rc != Z_STREAM_END) {
        std::string message = zlib_message(strm, rc);
        deflateEnd(&strm);
        throw subject_error("gzip compression failed: " + message);
    }
    std::string output(reinterpret_cast<const char*>(compressed.data()), strm.total_out);
    deflateEnd(&strm);
    return output;
}

std::string read_subject(const std::string& path) {
    std::string content;
    if (path == "-") {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    } else {
        std::ifstream ifs(path, std::ios::binary);
        if (!ifs.is_open()) {
            throw subject_error("cannot open file \"" + path + "\"");
        }
        content.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
        if (ifs.bad()) {
            throw subject_error("error while reading \"" + path + "\"");
        }
    }

    if (is_gzip(content)) {
        diagnostics::debug("\"" + path + "\" is gzip-compressed; inflating");
        return inflate_gzip(content);
    }
    return content;
}

} // namespace subject_reader
} // namespace rexbind
