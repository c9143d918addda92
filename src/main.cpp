#include "duet/config.hpp"
#include "duet/conversation_service.hpp"
#include "duet/errors.hpp"
#include "duet/memory_storage_driver.hpp"
#include "duet/pg_storage_driver.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace {

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options] <command> [args]\n"
              << "Options:\n"
              << "  --memory           Use a throwaway in-process store instead of PostgreSQL\n"
              << "  --dev              Enable debug logging\n"
              << "  --help             Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  init-schema                                   Create tables (idempotent)\n"
              << "  seed [users] [conversations] [max_messages]   Generate test data (10 15 50)\n"
              << "  send <sender> <receiver> <text...>            Send one message\n"
              << "  history <conversation_id> [limit] [cursor] [before_ts]\n"
              << "  conversations <user_id> [limit] [cursor]\n"
              << "  show <conversation_id>\n"
              << "  repair                                        Drain the repair journal once\n"
              << "\n"
              << "Environment variables:\n"
              << "  PG_HOST            PostgreSQL host (default: localhost)\n"
              << "  PG_PORT            PostgreSQL port (default: 5432)\n"
              << "  PG_DB              PostgreSQL database (default: postgres)\n"
              << "  PG_USER            PostgreSQL user (default: postgres)\n"
              << "  PG_PASSWORD        PostgreSQL password (default: postgres)\n"
              << "  DB_POOL_SIZE       Database pool size (default: 8)\n"
              << "  DB_SCHEMA          Schema holding the tables (default: duet)\n"
              << "  DUET_CURSOR_KEY    64 hex chars, shared by every process serving cursors\n"
              << "  REPAIR_JOURNAL_DIR Directory of the repair journal (default: none)\n"
              << "  LOG_LEVEL          trace, debug, info, warn, error, off (default: info)\n"
              << std::endl;
}

int64_t parse_int(const std::string& value, const char* what) {
    size_t pos = 0;
    int64_t result = 0;
    try {
        result = std::stoll(value, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
    }
    if (pos != value.size()) {
        throw std::invalid_argument(std::string("Invalid ") + what + ": " + value);
    }
    return result;
}

std::optional<std::string> optional_arg(const std::vector<std::string>& args, size_t index) {
    if (index < args.size() && !args[index].empty() && args[index] != "-") {
        return args[index];
    }
    return std::nullopt;
}

void print_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

template <typename T>
nlohmann::json page_to_json(const duet::Page<T>& page) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : page.items) {
        items.push_back(nlohmann::json(item));
    }
    nlohmann::json j = {{"items", items}, {"next_cursor", nullptr}};
    if (page.next_cursor) j["next_cursor"] = *page.next_cursor;
    return j;
}

std::shared_ptr<duet::StorageDriver> make_driver(const duet::Config& config, bool use_memory) {
    if (use_memory) {
        spdlog::info("Using in-process memory store (data is discarded on exit)");
        return std::make_shared<duet::MemoryStorageDriver>();
    }

    duet::SessionSettings settings;
    settings.statement_timeout_ms = config.database.statement_timeout;
    settings.lock_timeout_ms = config.database.lock_timeout;
    settings.idle_in_transaction_timeout_ms = config.database.idle_in_transaction_timeout;
    settings.schema = config.database.schema;

    auto pool = std::make_shared<duet::AsyncDbPool>(
        config.database.connection_string(), config.database.pool_size, settings);
    return std::make_shared<duet::PgStorageDriver>(pool);
}

nlohmann::json run_seed(duet::ConversationService& service, const std::vector<std::string>& args) {
    int64_t users = args.size() > 1 ? parse_int(args[1], "users") : 10;
    int64_t conversations = args.size() > 2 ? parse_int(args[2], "conversations") : 15;
    int64_t max_messages = args.size() > 3 ? parse_int(args[3], "max_messages") : 50;
    if (users < 2 || conversations < 1 || max_messages < 1) {
        throw std::invalid_argument("seed needs at least 2 users, 1 conversation and 1 message");
    }

    int64_t max_pairs = users * (users - 1) / 2;
    if (conversations > max_pairs) {
        spdlog::warn("Only {} distinct pairs among {} users, seeding {} conversations", max_pairs, users, max_pairs);
        conversations = max_pairs;
    }

    std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<int64_t> user_dist(1, users);
    std::uniform_int_distribution<int64_t> count_dist(1, max_messages);
    std::uniform_int_distribution<int64_t> gap_dist(1000, 3600 * 1000);

    static const std::vector<std::string> phrases = {
        "hey", "are you around?", "see you tomorrow", "sounds good", "thanks!",
        "running late", "did you see that?", "call me when you can", "ok", "lol"
    };
    std::uniform_int_distribution<size_t> phrase_dist(0, phrases.size() - 1);

    std::set<std::pair<int64_t, int64_t>> pairs;
    while (static_cast<int64_t>(pairs.size()) < conversations) {
        int64_t a = user_dist(rng);
        int64_t b = user_dist(rng);
        if (a == b) continue;
        pairs.emplace(std::min(a, b), std::max(a, b));
    }

    // Spread history over the last 30 days
    const duet::TimestampMs now = duet::system_clock_ms();
    int64_t sent = 0;
    int64_t incomplete = 0;

    for (const auto& pair : pairs) {
        int64_t count = count_dist(rng);
        duet::TimestampMs ts = now - 30LL * 24 * 3600 * 1000 + gap_dist(rng);
        for (int64_t i = 0; i < count && ts < now; ++i) {
            bool forward = (rng() & 1) == 0;
            duet::SendOptions options;
            options.client_timestamp = ts;
            auto result = service.send_message(forward ? pair.first : pair.second,
                                               forward ? pair.second : pair.first,
                                               phrases[phrase_dist(rng)], options);
            ++sent;
            if (!result.fanout_complete) ++incomplete;
            ts += gap_dist(rng);
        }
    }

    spdlog::info("Seeded {} message(s) across {} conversation(s)", sent, pairs.size());
    return {
        {"users", users},
        {"conversations", pairs.size()},
        {"messages", sent},
        {"fanout_incomplete", incomplete},
        {"repair_pending", service.repair().get_pending_count()}
    };
}

int run_command(duet::ConversationService& service, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (command == "init-schema") {
        service.initialize_schema();
        print_json({{"schema", "ready"}});
    } else if (command == "seed") {
        print_json(run_seed(service, args));
    } else if (command == "send") {
        if (args.size() < 4) {
            throw std::invalid_argument("send needs <sender> <receiver> <text...>");
        }
        std::string text = args[3];
        for (size_t i = 4; i < args.size(); ++i) {
            text += " " + args[i];
        }
        auto result = service.send_message(parse_int(args[1], "sender"), parse_int(args[2], "receiver"), text);
        print_json(result);
    } else if (command == "history") {
        if (args.size() < 2) {
            throw std::invalid_argument("history needs <conversation_id>");
        }
        int limit = args.size() > 2 ? static_cast<int>(parse_int(args[2], "limit")) : 0;
        std::optional<duet::TimestampMs> before;
        if (auto value = optional_arg(args, 4)) {
            before = parse_int(*value, "before_ts");
        }
        print_json(page_to_json(service.list_messages(args[1], optional_arg(args, 3), limit, before)));
    } else if (command == "conversations") {
        if (args.size() < 2) {
            throw std::invalid_argument("conversations needs <user_id>");
        }
        int limit = args.size() > 2 ? static_cast<int>(parse_int(args[2], "limit")) : 0;
        print_json(page_to_json(service.list_conversations_for_user(
            parse_int(args[1], "user_id"), optional_arg(args, 3), limit)));
    } else if (command == "show") {
        if (args.size() < 2) {
            throw std::invalid_argument("show needs <conversation_id>");
        }
        print_json(service.get_conversation(args[1]));
    } else if (command == "repair") {
        size_t before = service.repair().get_pending_count();
        size_t repaired = service.repair().drain_once();
        print_json({
            {"pending_before", before},
            {"repaired", repaired},
            {"pending_after", service.repair().get_pending_count()},
            {"failed", service.repair().get_failed_count()}
        });
    } else {
        std::cerr << "Unknown command: " << command << std::endl;
        return 2;
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    // Logs go to stderr, stdout carries the JSON output
    spdlog::set_default_logger(spdlog::stderr_color_mt("duet"));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

    duet::Config config = duet::Config::load();
    spdlog::set_level(spdlog::level::from_str(config.logging.log_level));

    bool use_memory = false;
    std::vector<std::string> args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (args.empty() && (arg == "--help" || arg == "-h")) {
            print_usage(argv[0]);
            return 0;
        } else if (args.empty() && arg == "--memory") {
            use_memory = true;
        } else if (args.empty() && arg == "--dev") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            args.push_back(arg);
        }
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // One-shot commands drain explicitly through `repair`
    config.repair.enabled = false;

    try {
        auto driver = make_driver(config, use_memory);
        duet::ConversationService service(driver, config);
        if (use_memory) {
            service.initialize_schema();
        }

        int rc = run_command(service, args);
        if (rc == 2) {
            print_usage(argv[0]);
        }
        return rc;

    } catch (const std::invalid_argument& e) {
        spdlog::error("{}", e.what());
        return 2;
    } catch (const duet::NotFound& e) {
        spdlog::error("Not found: {}", e.what());
        return 3;
    } catch (const duet::DuetError& e) {
        spdlog::error("Request failed: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Unexpected error: {}", e.what());
        return 1;
    }
}
