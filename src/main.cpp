#include "backends.hpp"
#include "log.hpp"
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include <array>
#include <chrono>
#include <stdexcept>

using namespace gitwire;

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
    std::string cmd;
    std::string service = "upload-pack";
    std::string backend = "socket";
    std::vector<std::string> args;
    TransportConfig config = config_from_env();
    int exit_code = 0;
    std::string error_message;
    std::chrono::steady_clock::time_point start_time;
    std::chrono::steady_clock::time_point end_time;
};

void print_usage(const char* program_name) {
    std::cout << "Smart HTTP transport probe\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n"
              << "  advertise <url>                 Fetch the ref advertisement\n"
              << "  post <url> <request-file>       Send a pack request after listing\n\n"
              << "Options:\n"
              << "  --service <upload-pack|receive-pack>\n"
              << "  --backend <socket|curl>\n"
              << "  --timeout <seconds>\n"
              << "  --cafile <pem>\n"
              << "  --insecure                      Skip TLS peer verification\n"
              << "  --verbose                       Log at debug level\n";
}

int copy_stream(SmartSubtransportStream& stream) {
    std::array<char, 16 * 1024> buf{};
    size_t total = 0;
    while (true) {
        auto n = stream.read(buf);
        if (!n) { std::cerr << "Error: " << describe(n.error()) << "\n"; return 1; }
        if (*n == 0) break;
        std::cout.write(buf.data(), static_cast<std::streamsize>(*n));
        total += *n;
    }
    std::cout.flush();
    Log::info("received " + std::to_string(total) + " bytes");
    return 0;
}

int cmd_advertise(const std::string& url, const FSMContext& ctx) {
    auto transport = TransportRegistry::instance().create(Remote("origin", url));
    if (!transport) { std::cerr << "Error: " << describe(transport.error()) << "\n"; return 1; }
    auto service = ctx.service == "receive-pack" ? Service::ReceivePackLs : Service::UploadPackLs;
    auto stream = transport->action(url, service);
    if (!stream) { std::cerr << "Error: " << describe(stream.error()) << "\n"; return 1; }
    int rc = copy_stream(**stream);
    if (auto closed = transport->close(); !closed) { std::cerr << "Error: " << describe(closed.error()) << "\n"; return 1; }
    return rc;
}

int cmd_post(const std::string& url, const std::string& request_file, const FSMContext& ctx) {
    std::ifstream in(request_file, std::ios::binary);
    if (!in) { std::cerr << "Error: cannot open " << request_file << "\n"; return 1; }
    std::ostringstream request;
    request << in.rdbuf();
    auto body = request.str();

    auto transport = TransportRegistry::instance().create(Remote("origin", url));
    if (!transport) { std::cerr << "Error: " << describe(transport.error()) << "\n"; return 1; }

    bool receive = ctx.service == "receive-pack";
    auto listing = transport->action(url, receive ? Service::ReceivePackLs : Service::UploadPackLs);
    if (!listing) { std::cerr << "Error: " << describe(listing.error()) << "\n"; return 1; }
    std::array<char, 16 * 1024> discard{};
    while (true) {
        auto n = (*listing)->read(discard);
        if (!n) { std::cerr << "Error: " << describe(n.error()) << "\n"; return 1; }
        if (*n == 0) break;
    }

    auto data = transport->action(url, receive ? Service::ReceivePack : Service::UploadPack);
    if (!data) { std::cerr << "Error: " << describe(data.error()) << "\n"; return 1; }
    if (auto w = (*data)->write(body); !w) { std::cerr << "Error: " << describe(w.error()) << "\n"; return 1; }
    int rc = copy_stream(**data);
    if (auto closed = transport->close(); !closed) { std::cerr << "Error: " << describe(closed.error()) << "\n"; return 1; }
    return rc;
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
                for (int i = 2; i < ctx.argc; ++i) {
                    std::string a = ctx.argv[i];
                    if (a == "--service" && i + 1 < ctx.argc) ctx.service = ctx.argv[++i];
                    else if (a == "--backend" && i + 1 < ctx.argc) ctx.backend = ctx.argv[++i];
                    else if (a == "--cafile" && i + 1 < ctx.argc) ctx.config.ca_file = ctx.argv[++i];
                    else if (a == "--timeout" && i + 1 < ctx.argc) {
                        try {
                            ctx.config.timeout_seconds = std::stoi(ctx.argv[++i]);
                        } catch (const std::exception&) {
                            ctx.error_message = std::string("invalid --timeout value: ") + ctx.argv[i];
                        }
                    }
                    else if (a == "--insecure") ctx.config.verify_peer = false;
                    else if (a == "--verbose") Log::set_level(LogLevel::Debug);
                    else ctx.args.push_back(a);
                }
                state = ctx.error_message.empty() ? FSMState::PreCommand : FSMState::Error;
                if (state == FSMState::Error) ctx.exit_code = 1;
                break;
            }
            case FSMState::PreCommand: {
                if (ctx.service != "upload-pack" && ctx.service != "receive-pack") {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown service: " + ctx.service;
                    state = FSMState::Error;
                    break;
                }
                auto backend = backend_from_string(ctx.backend);
                if (!backend) {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown backend: " + ctx.backend;
                    state = FSMState::Error;
                    break;
                }

                if (ctx.cmd == "advertise") {
                    if (ctx.args.empty()) {
                        ctx.exit_code = 1;
                        ctx.error_message = "advertise requires <url> argument.";
                        state = FSMState::Error;
                        break;
                    }
                } else if (ctx.cmd == "post") {
                    if (ctx.args.size() < 2) {
                        ctx.exit_code = 1;
                        ctx.error_message = "post requires <url> and <request-file> arguments.";
                        state = FSMState::Error;
                        break;
                    }
                } else {
                    ctx.exit_code = 1;
                    ctx.error_message = "Unknown command: " + ctx.cmd;
                    state = FSMState::Error;
                    break;
                }

                register_backend(*backend, ctx.config);
                Log::debug("using " + ctx.backend + " backend for " + ctx.cmd);
                state = FSMState::RunCommand;
                break;
            }
            case FSMState::RunCommand:
                if (ctx.cmd == "advertise") {
                    ctx.exit_code = cmd_advertise(ctx.args[0], ctx);
                } else {
                    ctx.exit_code = cmd_post(ctx.args[0], ctx.args[1], ctx);
                }
                state = FSMState::PostCommand;
                break;
            case FSMState::PostCommand:
                ctx.end_time = std::chrono::steady_clock::now();
                {
                    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(ctx.end_time - ctx.start_time).count();
                    Log::info(ctx.cmd + " finished in " + std::to_string(ms) + " ms");
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
