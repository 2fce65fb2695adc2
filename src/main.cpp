#include "settings.hpp"
#include "http.hpp"
#include "cancel_registry.hpp"
#include "event_bus.hpp"
#include "event.hpp"
#include "models.hpp"
#include "pull.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <cstring>
#include <atomic>
#include <csignal>
#include <chrono>
#include <mutex>
#include <memory>
#include <optional>
#include <vector>

static std::atomic<int> g_interrupts{0};
static std::atomic<bool> g_abort{false};

static void signal_handler(int /*sig*/) {
    if (g_interrupts.fetch_add(1) >= 1)
        g_abort.store(true);
}

static void print_usage() {
    std::cout << "Usage: ollie <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  pull NAME            Download a model, showing progress\n"
              << "  list                 List installed models\n"
              << "  show NAME            Show model details\n"
              << "  rm NAME              Delete a model\n"
              << "  settings             Print current settings\n"
              << "  settings set KEY VAL Change a setting (empty VAL clears it)\n"
              << "\n"
              << "Options:\n"
              << "  --server URL         Server base URL (default from settings)\n"
              << "  --id ID              Pull identifier (pull only; default: random UUID)\n"
              << "  --json               Print pull events as JSON lines (pull only)\n"
              << "  -h, --help           Show this help\n"
              << "\n"
              << "Ctrl+C during a pull cancels it; press again to abort the transfer.\n"
              << "\n"
              << "Environment variables:\n"
              << "  OLLAMA_HOST          Server address (overrides settings)\n"
              << "  OLLIE_SERVER_URL     Server base URL (overrides OLLAMA_HOST)\n";
}

struct CliArgs {
    std::string command;
    std::vector<std::string> positional;
    std::optional<std::string> server_url;
    std::optional<std::string> pull_id;
    bool json = false;
};

// ── pull ────────────────────────────────────────────────────────

static void subscribe_json_printer(ollie::EventBus& bus, std::mutex& out_mutex) {
    auto print = [&out_mutex](const char* tag, const nlohmann::json& payload) {
        nlohmann::json line = {{"event", tag}, {"payload", payload}};
        std::lock_guard<std::mutex> lock(out_mutex);
        std::cout << line.dump() << std::endl;
    };
    ollie::subscribe<ollie::PullStartEvent>(bus,
        [print](const ollie::PullStartEvent& ev) { print(ev.TAG, ev.to_json()); });
    ollie::subscribe<ollie::PullProgressEvent>(bus,
        [print](const ollie::PullProgressEvent& ev) { print(ev.TAG, ev.to_json()); });
    ollie::subscribe<ollie::PullCancelledEvent>(bus,
        [print](const ollie::PullCancelledEvent& ev) { print(ev.TAG, ev.to_json()); });
    ollie::subscribe<ollie::PullErrorEvent>(bus,
        [print](const ollie::PullErrorEvent& ev) { print(ev.TAG, ev.to_json()); });
    ollie::subscribe<ollie::PullCompleteEvent>(bus,
        [print](const ollie::PullCompleteEvent& ev) { print(ev.TAG, ev.to_json()); });
}

// Human-readable progress: one line per status, rewritten in place while
// byte counts advance.
static void subscribe_progress_printer(ollie::EventBus& bus) {
    auto last_status = std::make_shared<std::string>();

    ollie::subscribe<ollie::PullStartEvent>(bus,
        [](const ollie::PullStartEvent& ev) {
            std::cout << "pulling " << ev.name << " (" << ev.pull_id << ")\n";
        });

    ollie::subscribe<ollie::PullProgressEvent>(bus,
        [last_status](const ollie::PullProgressEvent& ev) {
            const auto& p = ev.progress;
            std::string status = p.value("status", "");
            if (status == "parsing_error") {
                std::cout << "\nunparsed: " << p.value("raw", "") << "\n";
                return;
            }
            bool same = (status == *last_status);
            if (!same && !last_status->empty()) std::cout << "\n";
            *last_status = status;

            if (p.contains("total") && p["total"].is_number_unsigned() &&
                p["total"].get<uint64_t>() > 0) {
                uint64_t total = p["total"].get<uint64_t>();
                uint64_t done = p.value("completed", uint64_t{0});
                std::cout << "\r" << status << " "
                          << (done * 100 / total) << "% ("
                          << ollie::format_bytes(done) << " / "
                          << ollie::format_bytes(total) << ")" << std::flush;
            } else if (!same) {
                std::cout << status << std::flush;
            }
        });

    ollie::subscribe<ollie::PullCancelledEvent>(bus,
        [](const ollie::PullCancelledEvent&) { std::cout << "\ncancelled\n"; });
    ollie::subscribe<ollie::PullErrorEvent>(bus,
        [](const ollie::PullErrorEvent& ev) { std::cout << "\nerror: " << ev.error << "\n"; });
    ollie::subscribe<ollie::PullCompleteEvent>(bus,
        [](const ollie::PullCompleteEvent&) { std::cout << "\ndone\n"; });
}

static int run_pull(const CliArgs& args, const ollie::Settings& settings) {
    if (args.positional.empty()) {
        std::cerr << "Error: pull requires a model name\n";
        return 1;
    }
    const std::string& name = args.positional[0];

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    ollie::http_set_abort_flag(&g_abort);

    ollie::PlatformHttpClient http_client;
    ollie::CancellationRegistry registry;
    ollie::EventBus bus;
    std::mutex out_mutex;
    if (args.json)
        subscribe_json_printer(bus, out_mutex);
    else
        subscribe_progress_printer(bus);

    ollie::PullManager manager(http_client, registry, settings.server_url);
    manager.set_event_bus(&bus);

    auto result_future = manager.start_pull_async(name, args.pull_id,
                                                  settings.server_url_or(args.server_url));

    bool cancel_sent = false;
    while (result_future.wait_for(std::chrono::milliseconds(100)) !=
           std::future_status::ready) {
        if (!cancel_sent && g_interrupts.load() > 0) {
            registry.cancel_all();
            cancel_sent = true;
        }
    }

    ollie::SimpleResponse result = result_future.get();
    if (!result.success) {
        if (!args.json)
            std::cerr << "Error: " << result.error.value_or("pull failed") << "\n";
        return 1;
    }
    return 0;
}

// ── list / show / rm ────────────────────────────────────────────

static int run_list(ollie::ModelClient& client) {
    auto response = client.list_models();
    if (response.models.empty()) {
        std::cout << "No models installed.\n";
        return 0;
    }
    for (const auto& m : response.models) {
        std::cout << m.name << "\t" << ollie::format_bytes(static_cast<uint64_t>(m.size));
        if (m.details && !m.details->parameter_size.empty())
            std::cout << "\t" << m.details->parameter_size;
        if (m.details && !m.details->quantization_level.empty())
            std::cout << "\t" << m.details->quantization_level;
        std::cout << "\t" << m.modified_at << "\n";
    }
    return 0;
}

static int run_show(ollie::ModelClient& client, const std::string& name) {
    auto info = client.show_model(name);
    if (info.license)
        std::cout << "License:\n" << *info.license << "\n\n";
    if (info.parameters)
        std::cout << "Parameters:\n"
                  << (info.parameters->is_string() ? info.parameters->get<std::string>()
                                                   : info.parameters->dump(2))
                  << "\n\n";
    if (info.template_)
        std::cout << "Template:\n" << *info.template_ << "\n\n";
    if (info.modelfile)
        std::cout << "Modelfile:\n" << *info.modelfile << "\n";
    for (const auto& [key, value] : info.extra) {
        if (key == "details" || key == "model_info")
            std::cout << key << ": " << value.dump(2) << "\n";
    }
    return 0;
}

static int run_rm(ollie::ModelClient& client, const std::string& name) {
    auto result = client.delete_model(name);
    if (!result.success) {
        std::cerr << "Error: " << result.error.value_or("delete failed") << "\n";
        return 1;
    }
    std::cout << "deleted " << name << "\n";
    return 0;
}

// ── settings ────────────────────────────────────────────────────

static int run_settings(const CliArgs& args) {
    if (args.positional.empty() || args.positional[0] == "get") {
        std::cout << ollie::Settings::load().to_json().dump(2) << "\n";
        return 0;
    }
    if (args.positional[0] == "set" && args.positional.size() >= 2) {
        // File values only; env overrides must not be persisted.
        auto settings = ollie::Settings::load(/*apply_env=*/false);
        std::string value = args.positional.size() >= 3 ? args.positional[2] : "";
        if (!settings.set(args.positional[1], value)) {
            std::cerr << "Error: invalid setting " << args.positional[1]
                      << "=" << value << "\n";
            return 1;
        }
        if (!settings.save()) return 1;
        std::cout << settings.to_json().dump(2) << "\n";
        return 0;
    }
    std::cerr << "Error: usage: ollie settings [get | set KEY VALUE]\n";
    return 1;
}

int main(int argc, char* argv[]) try {
    CliArgs args;
    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage();
            return 0;
        } else if (std::strcmp(argv[i], "--server") == 0 && i + 1 < argc) {
            args.server_url = argv[++i];
        } else if (std::strcmp(argv[i], "--id") == 0 && i + 1 < argc) {
            args.pull_id = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (argv[i][0] == '-' && argv[i][1] != '\0') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage();
            return 1;
        } else if (args.command.empty()) {
            args.command = argv[i];
        } else {
            args.positional.emplace_back(argv[i]);
        }
    }

    if (args.command.empty()) {
        print_usage();
        return 1;
    }
    if (args.command == "settings")
        return run_settings(args);

    ollie::http_init();
    auto settings = ollie::Settings::load();

    int rc = 1;
    if (args.command == "pull") {
        rc = run_pull(args, settings);
    } else if (args.command == "list" || args.command == "show" || args.command == "rm") {
        ollie::PlatformHttpClient http_client;
        ollie::ModelClient client(http_client, settings.server_url_or(args.server_url));
        if (args.command == "list") {
            rc = run_list(client);
        } else if (args.positional.empty()) {
            std::cerr << "Error: " << args.command << " requires a model name\n";
        } else if (args.command == "show") {
            rc = run_show(client, args.positional[0]);
        } else {
            rc = run_rm(client, args.positional[0]);
        }
    } else {
        std::cerr << "Unknown command: " << args.command << "\n";
        print_usage();
    }

    ollie::http_cleanup();
    return rc;
} catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << '\n';
    return 1;
}
