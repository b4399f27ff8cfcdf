#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>

#include "config.hpp"
#include "file_data_handler.hpp"
#include "ipc_transport_posix.hpp"
#include "payload_controller.hpp"
#include "platform_posix.hpp"
#include "uart_transport_posix.hpp"

using namespace sat_payload;

namespace {

volatile std::sig_atomic_t s_stop_requested = 0;

void OnSignal(int) { s_stop_requested = 1; }

struct Options {
  bool use_ipc{false};
  std::string uart_device{config::UartConfig::kDefaultDevice};
  std::string data_root{config::StorageConfig::kDefaultRoot};
  std::string power_gpio;
  unsigned long ticks{0};  // 0: до сигнала
  unsigned long period_ms{100};
  bool request_image{false};
};

void PrintUsage(const char* argv0) {
  std::fprintf(stderr,
               "Usage: %s [--uart <dev> | --ipc] [--data <dir>] "
               "[--ticks <n>] [--period-ms <ms>] [--power-gpio <path>] "
               "[--image]\n",
               argv0);
}

bool ParseUnsigned(const char* text, unsigned long& out) {
  char* end = nullptr;
  errno = 0;
  const unsigned long value = std::strtoul(text, &end, 10);
  if (errno != 0 || end == text || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

bool ParseOptions(int argc, char** argv, Options& opts) {
  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (std::strcmp(arg, "--ipc") == 0) {
      opts.use_ipc = true;
    } else if (std::strcmp(arg, "--image") == 0) {
      opts.request_image = true;
    } else if (std::strcmp(arg, "--uart") == 0 && has_value) {
      opts.uart_device = argv[++i];
      opts.use_ipc = false;
    } else if (std::strcmp(arg, "--data") == 0 && has_value) {
      opts.data_root = argv[++i];
    } else if (std::strcmp(arg, "--power-gpio") == 0 && has_value) {
      opts.power_gpio = argv[++i];
    } else if (std::strcmp(arg, "--ticks") == 0 && has_value) {
      if (!ParseUnsigned(argv[++i], opts.ticks)) return false;
    } else if (std::strcmp(arg, "--period-ms") == 0 && has_value) {
      if (!ParseUnsigned(argv[++i], opts.period_ms) || opts.period_ms == 0) {
        return false;
      }
    } else {
      return false;
    }
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  Options opts;
  if (!ParseOptions(argc, argv, opts)) {
    PrintUsage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, OnSignal);
  std::signal(SIGTERM, OnSignal);
  // Запись в FIFO без читателя не должна завершать процесс
  std::signal(SIGPIPE, SIG_IGN);

  PlatformPosix platform(opts.power_gpio);

  std::unique_ptr<PayloadTransport> transport;
  if (opts.use_ipc) {
    transport = std::make_unique<IpcTransportPosix>(platform);
  } else {
    transport = std::make_unique<UartTransportPosix>(platform, opts.uart_device);
  }
  if (transport->Init() != 0) {
    LogF(platform, LogLevel::Warning,
         "Transport %s init failed, will retry on power-up", transport->Name());
  }

  FileDataHandler storage(platform, opts.data_root);
  PayloadController controller(platform, *transport, storage);

  LogF(platform, LogLevel::Info, "Payload SIL runner: link=%s data=%s",
       transport->Name(), opts.data_root.c_str());

  if (!controller.AddRequest(ExternalRequest::TurnOn)) {
    platform.Log(LogLevel::Error, "Failed to queue TURN_ON");
    return 1;
  }

  bool image_requested = false;
  for (unsigned long tick = 0; opts.ticks == 0 || tick < opts.ticks; tick++) {
    if (s_stop_requested) {
      break;
    }

    controller.Tick();

    if (opts.request_image && !image_requested &&
        controller.GetState() == PayloadState::Ready) {
      image_requested = controller.AddRequest(ExternalRequest::RequestImage);
    }

    platform.DelayMs(static_cast<uint32_t>(opts.period_ms));
  }

  // Штатное выключение: ждём Off не дольше таймаута выключения
  if (controller.GetState() != PayloadState::Off) {
    const auto request = controller.GetState() == PayloadState::ShuttingDown
                             ? ExternalRequest::NoAction
                             : ExternalRequest::TurnOff;
    if (request != ExternalRequest::NoAction &&
        !controller.AddRequest(request)) {
      platform.Log(LogLevel::Error, "Failed to queue TURN_OFF");
    }
    const uint32_t deadline =
        platform.GetTimeMs() + controller.GetConfig().shutdown_timeout_ms +
        static_cast<uint32_t>(opts.period_ms);
    while (controller.GetState() != PayloadState::Off &&
           static_cast<int32_t>(deadline - platform.GetTimeMs()) > 0) {
      controller.Tick();
      platform.DelayMs(static_cast<uint32_t>(opts.period_ms));
    }
    if (controller.GetState() != PayloadState::Off &&
        !controller.AddRequest(ExternalRequest::ForcePowerOff)) {
      platform.Log(LogLevel::Error, "Failed to queue FORCE_POWER_OFF");
    }
    controller.Tick();
  }

  const TransferStats& stats = controller.GetStats();
  LogF(platform, LogLevel::Info,
       "Stopped: state=%s last_error=%s received=%u skipped=%u",
       ToString(controller.GetState()),
       protocol::ToString(controller.GetLastError()),
       static_cast<unsigned>(stats.total_packets_received),
       static_cast<unsigned>(stats.packets_skipped_after_max_retries));
  return 0;
}
