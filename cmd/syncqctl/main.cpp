#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/item.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using syncq::model::ItemView;

static void Usage() {
  std::cout << "Usage:\n"
            << "  syncqctl <config.yaml> depth\n"
            << "  syncqctl <config.yaml> status <id>\n"
            << "  syncqctl <config.yaml> inspect <id>\n"
            << "  syncqctl <config.yaml> dead [limit]\n"
            << "  syncqctl <config.yaml> purge <id> [id...]\n"
            << "  syncqctl <config.yaml> sweep\n"
            << "  syncqctl <config.yaml> enqueue <critical|high|normal|low> <file> [idempotency_key]\n";
}

static syncq::model::ItemId ParseId(const std::string& text) {
  try {
    return syncq::util::FromString(text);
  } catch (const std::invalid_argument& e) {
    std::cerr << "invalid id '" << text << "': " << e.what() << "\n";
    std::exit(1);
  }
}

static void PrintView(const ItemView& v) {
  std::cout << "id:              " << syncq::util::ToString(v.id) << "\n"
            << "status:          " << syncq::model::ToString(v.status) << "\n"
            << "priority:        " << syncq::model::ToString(v.priority) << "\n"
            << "attempts:        " << v.attempts << "\n"
            << "idempotency_key: " << v.idempotency_key.value_or("-") << "\n"
            << "codec:           " << v.payload_codec << "\n"
            << "enqueued_at:     " << syncq::util::FormatTimestamp(v.enqueued_at) << "\n"
            << "updated_at:      " << syncq::util::FormatTimestamp(v.updated_at) << "\n"
            << "next_attempt_at: " << syncq::util::FormatTimestamp(v.next_attempt_at) << "\n";
  if (v.reservation_deadline) {
    std::cout << "reserved_until:  " << syncq::util::FormatTimestamp(*v.reservation_deadline) << "\n";
  }
  if (v.last_error) {
    std::cout << "last_error:      " << *v.last_error << "\n";
  }
}

static std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = syncq::config::ConfigLoader::LoadFromYaml(config_path);
    syncq::config::ConfigLoader::Validate(config);
    syncq::observability::InitializeLogging(config);

    // admin tooling: no forwarder, no worker
    auto  runtime = syncq::factory::BuildRuntime(config, nullptr, nullptr);
    auto& queue   = *runtime.queue;

    // ------------------------------------------------------------

    if (cmd == "depth") {
      const auto counts = queue.DepthByStatus();
      for (const auto& [status, n] : counts) {
        std::cout << syncq::model::ToString(status) << "\t" << n << "\n";
      }
      for (const auto& [priority, age] : queue.OldestPendingAge()) {
        std::cout << "oldest_pending[" << syncq::model::ToString(priority) << "]\t" << age.count() << "ms\n";
      }
      std::cout << "healthy\t" << (queue.Healthy() ? "yes" : "no") << "\n";
    } else if (cmd == "status") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      std::cout << syncq::model::ToString(queue.Status(ParseId(argv[3]))) << "\n";
    } else if (cmd == "inspect") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      PrintView(queue.Inspect(ParseId(argv[3])));
    } else if (cmd == "dead") {
      std::size_t limit = 50;
      if (argc >= 4) {
        limit = std::stoul(argv[3]);
      }
      const auto dead = queue.DeadLetters(limit);
      for (const auto& v : dead) {
        std::cout << syncq::util::ToString(v.id) << "\t" << syncq::model::ToString(v.priority) << "\t" << v.attempts << "\t"
                  << syncq::util::FormatTimestamp(v.updated_at) << "\t" << v.last_error.value_or("") << "\n";
      }
      std::cout << dead.size() << " dead item(s)\n";
    } else if (cmd == "purge") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      std::vector<syncq::model::ItemId> ids;
      for (int i = 3; i < argc; ++i) {
        ids.push_back(ParseId(argv[i]));
      }
      std::cout << "purged " << queue.Purge(ids) << " of " << ids.size() << " item(s)\n";
    } else if (cmd == "sweep") {
      const auto reaped    = queue.Reap();
      const auto retention = queue.ApplyRetention();
      std::cout << "reaped " << reaped << ", purged committed " << retention.committed_purged << ", purged dead " << retention.dead_purged << "\n";
    } else if (cmd == "enqueue") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      auto priority = syncq::model::ParsePriority(argv[3]);
      if (!priority) {
        std::cerr << "unsupported priority: " << argv[3] << "\n";
        return 1;
      }
      auto payload = ReadFile(argv[4]);
      if (!payload) {
        std::cerr << "cannot read " << argv[4] << "\n";
        return 1;
      }
      std::optional<std::string> key;
      if (argc >= 6) {
        key = argv[5];
      }
      std::cout << syncq::util::ToString(queue.Enqueue(*payload, *priority, key)) << "\n";
    } else {
      Usage();
      return 1;
    }
  } catch (const syncq::util::NotFound& e) {
    std::cerr << e.what() << "\n";
    syncq::observability::ShutdownLogging();
    return 3;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    syncq::observability::ShutdownLogging();
    return 2;
  }

  syncq::observability::ShutdownLogging();
  return 0;
}
