#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/auth/hawk.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

static void Usage() {
  std::cout << "Usage:\n"
            << "  fmdctl --config <config.yaml> register <user_id> <device_id|-> <secret> [push_url] [accepts] [lockable=0|1]\n"
            << "  fmdctl --config <config.yaml> device <device_id>\n"
            << "  fmdctl --config <config.yaml> devices <user_id> [old_user_id]\n"
            << "  fmdctl --config <config.yaml> delete <device_id>\n"
            << "  fmdctl --config <config.yaml> queue <device_id> <type> <command>\n"
            << "  fmdctl --config <config.yaml> pending <device_id>\n"
            << "  fmdctl --config <config.yaml> purge <device_id>\n"
            << "  fmdctl --config <config.yaml> locate <device_id> <lat> <lon> [alt] [accuracy]\n"
            << "  fmdctl --config <config.yaml> positions <device_id>\n"
            << "  fmdctl --config <config.yaml> gc\n"
            << "  fmdctl --config <config.yaml> nonce-issue\n"
            << "  fmdctl --config <config.yaml> nonce-check <nonce>\n"
            << "  fmdctl --config <config.yaml> sign <device_id> <secret> <method> <scheme> <host> <path> [body] [ext] [content_type]\n";
}

static std::string Arg(int argc, char** argv, int i, std::string fallback = {}) {
  return i < argc ? std::string(argv[i]) : fallback;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  // first command argument
  const int a = 4;

  try {
    auto config = fmd::config::ConfigLoader::LoadFromYaml(config_path);
    fmd::observability::InitializeLogging(config);

    // ------------------------------------------------------------

    if (cmd == "sign") {
      if (argc < a + 6) return 1;

      fmd::auth::HawkOptions options;
      options.override_port = config.hawk().override_port();
      options.show_hash     = config.hawk().show_hash();
      fmd::auth::HawkAuthenticator hawk(options);

      fmd::auth::RequestInfo request;
      request.method       = argv[a + 2];
      request.scheme       = argv[a + 3];
      request.host         = argv[a + 4];
      request.path         = argv[a + 5];
      request.content_type = Arg(argc, argv, a + 8);

      std::cout << "Authorization: " << hawk.AsHeader(request, argv[a], Arg(argc, argv, a + 6), Arg(argc, argv, a + 7), argv[a + 1]) << "\n";
      return 0;
    }

    auto app = fmd::factory::Build(config);

    // ------------------------------------------------------------

    if (cmd == "register") {
      if (argc < a + 3) return 1;

      fmd::model::Device device;
      device.id          = Arg(argc, argv, a + 1) == "-" ? "" : Arg(argc, argv, a + 1);
      device.hawk_secret = argv[a + 2];
      device.push_url    = Arg(argc, argv, a + 3);
      device.accepts     = Arg(argc, argv, a + 4);
      device.lockable    = Arg(argc, argv, a + 5, "0") == "1";
      device.logged_in   = !device.push_url.empty();

      std::cout << "device=" << app.devices->Register(argv[a], device) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "device") {
      if (argc < a + 1) return 1;

      auto device = app.devices->GetDeviceInfo(argv[a]);
      std::cout << "id=" << device.id << "\n"
                << "user=" << device.user_id << "\n"
                << "lockable=" << device.lockable << "\n"
                << "logged_in=" << device.logged_in << "\n"
                << "push_url=" << device.push_url << "\n"
                << "accepts=" << device.accepts << "\n"
                << "last_exchange_ms=" << device.last_exchange_ms << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "devices") {
      if (argc < a + 1) return 1;

      for (const auto& entry : app.devices->GetDevicesForUser(argv[a], Arg(argc, argv, a + 1))) {
        std::cout << entry.id << " " << entry.name << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "delete") {
      if (argc < a + 1) return 1;

      app.devices->DeleteDevice(argv[a]);
      std::cout << "deleted\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "queue") {
      if (argc < a + 3) return 1;

      app.commands->StoreCommand(argv[a], argv[a + 2], argv[a + 1]);
      std::cout << "queued\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "pending") {
      if (argc < a + 1) return 1;

      auto pending = app.commands->GetPending(argv[a]);
      if (!pending.has_value()) {
        std::cout << "none\n";
        return 0;
      }
      std::cout << "type=" << pending->type << "\n"
                << "cmd=" << pending->cmd << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "purge") {
      if (argc < a + 1) return 1;

      app.commands->PurgeCommands(argv[a]);
      std::cout << "purged\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "locate") {
      if (argc < a + 3) return 1;

      fmd::model::Position position;
      position.latitude  = std::stod(argv[a + 1]);
      position.longitude = std::stod(argv[a + 2]);
      position.altitude  = std::stod(Arg(argc, argv, a + 3, "0"));
      position.accuracy  = std::stod(Arg(argc, argv, a + 4, "0"));

      app.positions->SetDeviceLocation(argv[a], position);
      std::cout << "stored\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "positions") {
      if (argc < a + 1) return 1;

      for (const auto& p : app.positions->GetPositions(argv[a])) {
        std::cout << "time=" << p.time << " lat=" << p.latitude << " lon=" << p.longitude << " alt=" << p.altitude
                  << " acc=" << p.accuracy << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "gc") {
      std::cout << "positions=" << app.positions->GcDatabase() << "\n";
      std::cout << "nonces=" << app.nonces->PurgeExpired() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "nonce-issue") {
      std::cout << app.nonces->Issue() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "nonce-check") {
      if (argc < a + 1) return 1;

      const bool valid = app.nonces->VerifyAndConsume(argv[a]);
      std::cout << (valid ? "valid" : "invalid") << "\n";
      return valid ? 0 : 3;
    }
  } catch (const fmd::util::Error& e) {
    std::cerr << fmd::util::ToString(e.kind()) << ": " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
