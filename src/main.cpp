#include "compact_log.hpp"
#include "downloader.hpp"
#include "range_reader.hpp"
#include <unistd.h>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <chrono>
#include <fstream>
#include <iostream>
#include <new>
#include <stdexcept>
#include <string>
#include <vector>

using namespace rangefetch;

enum class FSMState {
    Init,
    ParseArgs,
    PreCommand,
    RunCommand,
    PostCommand,
    Error,
    Done
};

struct FSMContext {
    int argc;
    char** argv;
    std::string cmd, sha256;
    std::vector<std::string> args;
    DownloadConfig download;
    HttpConfig http;
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
    std::string result_message;
};

void print_usage(const char* program_name) {
    std::cout << "Parallel HTTP range downloader\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  info <url>                      Probe the resource and print its metadata\n"
              << "  get <url> <output>              Download to a file\n"
              << "  fetch <url> <output>            Download into memory, verify, then save\n"
              << "  read <url> <offset> <length>    Read one byte range to stdout\n\n"
              << "Options:\n"
              << "  --threads <n>                   Concurrent range requests (default 48)\n"
              << "  --chunk-size <bytes>            Chunk size (default 65536)\n"
              << "  --timeout <seconds>             Per chunk timeout (default 60)\n"
              << "  --sha256 <hex>                  Expected digest for fetch\n"
              << "  --header \"Name: value\"          Extra request header, repeatable\n"
              << "  --verbose                       Log progress to stderr\n";
}

template<typename T>
bool parse_number(const std::string& s, T& out) {
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

int report(const RangeErrorInfo& err) {
    std::cerr << "Error: " << describe(err) << "\n";
    return 1;
}

std::shared_ptr<IRequestExecutor> make_client(const FSMContext& ctx) {
    return std::make_shared<HttpClient>(ctx.http);
}

int cmd_info(const FSMContext& ctx) {
    HttpRequest req;
    req.url = ctx.args[0];
    req.headers = ctx.download.headers;
    auto reader = RangeReader::create(make_client(ctx), req);
    if (!reader) return report(reader.error());
    std::cout << "URL:           " << ctx.args[0] << "\n"
              << "Size:          " << reader->size() << "\n"
              << "Content-Type:  " << reader->content_type() << "\n"
              << "Last-Modified: " << reader->last_modified() << "\n"
              << "ETag:          " << reader->etag() << "\n";
    return 0;
}

int cmd_get(const FSMContext& ctx) {
    auto res = download_to_file(Context::background(), make_client(ctx), ctx.args[0], ctx.args[1], ctx.download);
    if (!res) return report(res.error());
    std::cout << "Saved " << ctx.args[0] << " to " << ctx.args[1] << "\n";
    return 0;
}

int cmd_fetch(const FSMContext& ctx) {
    auto client = make_client(ctx);
    auto res = ctx.sha256.empty()
        ? download(Context::background(), client, ctx.args[0], ctx.download)
        : download_with_checksum(Context::background(), client, ctx.args[0], ctx.sha256, ctx.download);
    if (!res) return report(res.error());

    std::ofstream file(ctx.args[1], std::ios::binary | std::ios::trunc);
    if (!file) return report(RangeErrorInfo{RangeError::FileWriteError, "cannot open " + ctx.args[1]});
    file.write(res->data(), static_cast<std::streamsize>(res->size()));
    if (!file) return report(RangeErrorInfo{RangeError::FileWriteError, "cannot write " + ctx.args[1]});
    std::cout << "Saved " << res->size() << " bytes to " << ctx.args[1]
              << (ctx.sha256.empty() ? "\n" : " (sha256 verified)\n");
    return 0;
}

int cmd_read(const FSMContext& ctx) {
    int64_t offset = 0;
    size_t length = 0;
    if (!parse_number(ctx.args[1], offset) || !parse_number(ctx.args[2], length) || offset < 0) {
        return report(RangeErrorInfo{RangeError::InvalidArgument, "offset and length must be non-negative integers"});
    }
    HttpRequest req;
    req.url = ctx.args[0];
    req.headers = ctx.download.headers;
    auto reader = RangeReader::create(make_client(ctx), req);
    if (!reader) return report(reader.error());

    // Never allocate more than the resource can return from offset.
    if (reader->size() >= 0) {
        auto available = static_cast<uint64_t>(std::max<int64_t>(reader->size() - offset, 0));
        length = static_cast<size_t>(std::min<uint64_t>(length, available));
    }
    std::vector<char> buf;
    try {
        buf.resize(length);
    } catch (const std::bad_alloc&) {
        return report(RangeErrorInfo{RangeError::InvalidArgument, "cannot allocate " + std::to_string(length) + " bytes"});
    } catch (const std::length_error&) {
        return report(RangeErrorInfo{RangeError::InvalidArgument, "cannot allocate " + std::to_string(length) + " bytes"});
    }
    auto n = reader->read_at(buf, offset);
    if (!n) return report(n.error());
    compact::Writer::raw(STDOUT_FILENO, buf.data(), n->bytes);
    if (n->eof) compact::Log::info("reached end of resource");
    return 0;
}

int main(int argc, char** argv) {
    FSMState state = FSMState::Init;
    FSMContext ctx{argc, argv};
    while (state != FSMState::Done) {
        switch (state) {
            case FSMState::Init:
                ctx.start_time = std::chrono::steady_clock::now();
                if (ctx.argc < 2) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                } else {
                    ctx.cmd = ctx.argv[1];
                    state = FSMState::ParseArgs;
                }
                break;
            case FSMState::ParseArgs: {
                state = FSMState::PreCommand;
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    bool has_value = i + 1 < ctx.argc;
                    if (a == "--threads" && has_value) {
                        if (!parse_number(std::string(ctx.argv[++i]), ctx.download.worker_count)) {
                            ctx.error_message = "--threads expects a number";
                        }
                    } else if (a == "--chunk-size" && has_value) {
                        if (!parse_number(std::string(ctx.argv[++i]), ctx.download.chunk_size)) {
                            ctx.error_message = "--chunk-size expects a number";
                        }
                    } else if (a == "--timeout" && has_value) {
                        long seconds = 0;
                        if (!parse_number(std::string(ctx.argv[++i]), seconds) || seconds <= 0) {
                            ctx.error_message = "--timeout expects a positive number of seconds";
                        } else {
                            ctx.download.chunk_timeout = std::chrono::seconds(seconds);
                        }
                    } else if (a == "--sha256" && has_value) {
                        ctx.sha256 = ctx.argv[++i];
                    } else if (a == "--header" && has_value) {
                        std::string h = ctx.argv[++i];
                        auto colon = h.find(':');
                        if (colon == std::string::npos) {
                            ctx.error_message = "--header expects \"Name: value\"";
                        } else {
                            auto value = h.substr(colon + 1);
                            value.erase(0, value.find_first_not_of(" \t"));
                            ctx.download.headers[h.substr(0, colon)] = value;
                        }
                    } else if (a == "--verbose") {
                        compact::Log::set_level(compact::Level::Info);
                    } else {
                        ctx.args.push_back(a);
                    }
                }
                if (!ctx.error_message.empty()) {
                    ctx.exit_code = 1;
                    state = FSMState::Error;
                }
                break;
            }
            case FSMState::PreCommand: {
                size_t required = 0;
                if (ctx.cmd == "info") required = 1;
                else if (ctx.cmd == "get" || ctx.cmd == "fetch") required = 2;
                else if (ctx.cmd == "read") required = 3;
                else {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }
                if (ctx.args.size() < required) {
                    ctx.exit_code = 1;
                    ctx.error_message = ctx.cmd + " requires " + std::to_string(required) + " argument(s).";
                    state = FSMState::Error;
                    break;
                }
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                if (ctx.cmd == "info") ctx.exit_code = cmd_info(ctx);
                else if (ctx.cmd == "get") ctx.exit_code = cmd_get(ctx);
                else if (ctx.cmd == "fetch") ctx.exit_code = cmd_fetch(ctx);
                else ctx.exit_code = cmd_read(ctx);
                ctx.result_message = ctx.cmd + " command executed.";
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    compact::Log::info(ctx.result_message + " Elapsed: " + std::to_string(ms) + " ms");
                }
                state = FSMState::Done;
                break;
            case FSMState::Error:
                if (!ctx.error_message.empty()) std::cerr << "Error: " << ctx.error_message << "\n";
                print_usage(ctx.argv[0]);
                state = FSMState::Done;
                break;
            case FSMState::Done:
                break;
        }
    }
    return ctx.exit_code;
}
