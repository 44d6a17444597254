#include "inference/sherpa_ws_backend.hpp"
#include "inference/child_process.hpp"
#include "util/log.hpp"
#include "util/strings.hpp"
#include "wav.hpp"

#include <algorithm>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <cstring>
#include <filesystem>
#include <format>
#include <nlohmann/json.hpp>
#include <thread>

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace fs = std::filesystem;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

const char* const kModelFiles[] = {
    "encoder.int8.onnx",
    "decoder.int8.onnx",
    "joiner.int8.onnx",
    "tokens.txt",
};

void put_le32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>(v >> (8 * i)));
}

// Runs one async operation to completion on a private io_context.
template <typename Initiate>
beast::error_code run_op(net::io_context& ioc, Initiate&& initiate) {
    beast::error_code result;
    initiate([&result](beast::error_code ec, auto&&...) { result = ec; });
    ioc.restart();
    ioc.run();
    return result;
}

Error classify(const beast::error_code& ec, std::string_view what) {
    auto msg = std::format("sherpa-onnx {}: {}", what, ec.message());
    if (ec == beast::error::timeout || ec == net::error::timed_out) {
        return {.code = ErrorCode::Timeout, .message = std::move(msg)};
    }
    if (ec == websocket::error::closed || ec == net::error::eof) {
        return {.code = ErrorCode::PrematureClose, .message = std::move(msg)};
    }
    return {.code = ErrorCode::ConnectionFailed, .message = std::move(msg)};
}

} // namespace

namespace sherpa_protocol {

std::vector<uint8_t> encode_request(std::span<const float> samples, uint32_t sample_rate) {
    std::vector<uint8_t> out;
    out.reserve(8 + samples.size() * sizeof(float));
    put_le32(out, sample_rate);
    put_le32(out, static_cast<uint32_t>(samples.size() * sizeof(float)));
    for (float s : samples) {
        uint32_t bits;
        std::memcpy(&bits, &s, sizeof(bits));
        put_le32(out, bits);
    }
    return out;
}

std::string parse_reply(const std::string& reply) {
    try {
        auto j = json::parse(reply);
        if (j.is_object()) {
            if (j.contains("text") && j["text"].is_string()) return trim(j["text"].get<std::string>());
            return {};
        }
    } catch (const json::exception&) {
    }
    return trim(reply);
}

int default_thread_count(unsigned hardware_threads) {
    int cpus = std::max(1, static_cast<int>(hardware_threads));
    int reserve = std::max(4, static_cast<int>(cpus * 0.55));
    int upper = std::min(8, cpus);
    return std::clamp(cpus - reserve, std::min(2, upper), upper);
}

} // namespace sherpa_protocol

std::vector<BinaryCandidate> SherpaWsBackend::binaries(bool) const {
    return {{.name = "sherpa-onnx-offline-websocket-server", .gpu = false}};
}

Result<std::vector<std::string>> SherpaWsBackend::build_args(const std::string& model_path,
                                                            uint16_t port,
                                                            const LaunchOptions& options) const {
    fs::path dir(model_path);
    for (const char* file : kModelFiles) {
        std::error_code ec;
        if (!fs::exists(dir / file, ec)) {
            return make_error(ErrorCode::InvalidArgument,
                              std::format("model directory {} is missing {}", model_path, file));
        }
    }

    int threads = options.threads > 0
        ? options.threads
        : sherpa_protocol::default_thread_count(std::thread::hardware_concurrency());

    return std::vector<std::string>{
        "--tokens=" + (dir / "tokens.txt").string(),
        "--encoder=" + (dir / "encoder.int8.onnx").string(),
        "--decoder=" + (dir / "decoder.int8.onnx").string(),
        "--joiner=" + (dir / "joiner.int8.onnx").string(),
        "--port=" + std::to_string(port),
        "--num-threads=" + std::to_string(threads),
    };
}

bool SherpaWsBackend::check_ready(const ChildProcess& process, uint16_t) {
    return process.output_contains(kReadyMarker);
}

bool SherpaWsBackend::healthy(uint16_t, bool process_alive) {
    return process_alive;
}

Result<TranscriptResult> SherpaWsBackend::transcribe(uint16_t port,
                                                     std::span<const int16_t> samples,
                                                     uint32_t sample_rate,
                                                     const TranscribeOptions&) {
    if (samples.empty()) {
        return make_error(ErrorCode::InvalidArgument, "empty audio");
    }

    double duration_s = static_cast<double>(samples.size()) / sample_rate;
    auto payload = sherpa_protocol::encode_request(wav::to_float32(samples), sample_rate);
    auto start = std::chrono::steady_clock::now();

    net::io_context ioc;
    websocket::stream<beast::tcp_stream> ws(ioc);
    // One deadline covers the whole exchange; on expiry the stream is closed
    // and the pending operation fails with beast::error::timeout.
    beast::get_lowest_layer(ws).expires_after(request_timeout_);

    tcp::endpoint endpoint(net::ip::make_address_v4("127.0.0.1"), port);
    auto ec = run_op(ioc, [&](auto handler) {
        beast::get_lowest_layer(ws).async_connect(endpoint, std::move(handler));
    });
    if (ec) return std::unexpected(classify(ec, "connect"));

    ec = run_op(ioc, [&](auto handler) {
        ws.async_handshake(std::format("127.0.0.1:{}", port), "/", std::move(handler));
    });
    if (ec) return std::unexpected(classify(ec, "handshake"));

    ws.binary(true);
    ec = run_op(ioc, [&](auto handler) { ws.async_write(net::buffer(payload), std::move(handler)); });
    if (ec) return std::unexpected(classify(ec, "write"));

    beast::flat_buffer buffer;
    ec = run_op(ioc, [&](auto handler) { ws.async_read(buffer, std::move(handler)); });
    if (ec) return std::unexpected(classify(ec, "read"));
    auto reply = beast::buffers_to_string(buffer.data());

    // Tell the server this connection is finished, then close.
    ws.text(true);
    ec = run_op(ioc, [&](auto handler) {
        ws.async_write(net::buffer(std::string_view("Done")), std::move(handler));
    });
    if (!ec) {
        ec = run_op(ioc, [&](auto handler) {
            ws.async_close(websocket::close_code::normal, std::move(handler));
        });
    }
    if (ec) logging::debug("sherpa-onnx: closing connection: {}", ec.message());

    double processing_s = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    logging::debug("sherpa-onnx: {:.2f}s of audio in {:.2f}s", duration_s, processing_s);

    return TranscriptResult{
        .text = sherpa_protocol::parse_reply(reply),
        .duration_s = duration_s,
        .processing_s = processing_s,
    };
}
