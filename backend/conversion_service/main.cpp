#include "application/job_orchestrator.hpp"
#include "common/config/config.hpp"
#include "common/logger.hpp"
#include "common/restful/http_server.hpp"
#include "infrastructure/curl_transfer.hpp"
#include "infrastructure/encoder_supervisor.hpp"
#include "infrastructure/ffmpeg_media_probe.hpp"
#include "infrastructure/file_transfer.hpp"
#include "infrastructure/profile_registry.hpp"
#include "infrastructure/transfer_stager.hpp"
#include "infrastructure/workspace_manager.hpp"
#include "interface/rest_api_handler.hpp"
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <boost/asio.hpp>

extern "C" {
  #include <libavutil/log.h>
}

namespace {

void printUsage(const char* argv0) {
  std::cerr << "usage: " << argv0 << " [--config <path>]" << std::endl;
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (const char* env_path = std::getenv("CONVERTER_CONFIG")) {
    config_path = env_path;
  }
  for (int i = 1; i < argc; ++i) {
    if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      config_path = argv[++i];
    } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      printUsage(argv[0]);
      return 0;
    } else {
      printUsage(argv[0]);
      return 2;
    }
  }

  try {
    auto& cfg = config::Config::getInstance();
    if (!config_path.empty()) {
      cfg.loadFile(config_path);
    }
    cfg.applyEnvironment();
    cfg.validate();
    common::Logger::setLevel(common::Logger::parseLevel(cfg.getLogLevel()));
    common::setThreadName("main");

    const auto& converter = cfg.getConverter();
    if (auto encoder = conversion_service::EncoderSupervisor::resolveExecutable(converter.encoder_executable_path)) {
      LOG_INFO("Using encoder " + *encoder);
    } else {
      LOG_WARN("Encoder '" + converter.encoder_executable_path + "' not found; jobs will fail at the encoding stage");
    }

    auto workspaces = std::make_shared<conversion_service::WorkspaceManager>(
      conversion_service::WorkspaceOptions{converter.scratch_root_path, converter.min_free_space_bytes});
    if (auto swept = workspaces->sweepOrphans(); swept > 0) {
      LOG_INFO("Removed " + std::to_string(swept) + " orphaned workspace(s) under " + workspaces->root().string());
    }

    std::vector<std::shared_ptr<conversion_service::TransferService>> transports{
      std::make_shared<conversion_service::FileTransfer>(converter.transfer_chunk_bytes),
      std::make_shared<conversion_service::CurlTransfer>(converter.transfer_auth_token)
    };
    auto stager = std::make_shared<conversion_service::TransferStager>(
      transports,
      conversion_service::TransferOptions{
        converter.transfer_chunk_bytes,
        converter.progress_interval,
        converter.output_endpoint
      });

    auto profiles = std::make_shared<const conversion_service::ProfileRegistry>(
      conversion_service::ProfileRegistry::fromConfig(cfg.getProfiles()));
    for (const auto& profile : profiles->list()) {
      LOG_DEBUG("Profile " + profile.debug());
    }

    auto probe = std::make_shared<conversion_service::FfmpegMediaProbe>(AV_LOG_ERROR);
    auto encoder = std::make_shared<conversion_service::EncoderSupervisor>(
      conversion_service::EncoderOptions{
        converter.encoder_executable_path,
        converter.termination_grace,
        converter.progress_interval
      });

    auto orchestrator = std::make_shared<conversion_service::JobOrchestrator>(
      conversion_service::OrchestratorOptions::fromConfig(converter),
      workspaces, stager, profiles, probe, encoder);

    const auto& http_config = cfg.getHttp();
    boost::asio::io_context ioc{1};
    auto http_endpoint = boost::asio::ip::tcp::endpoint{
      boost::asio::ip::make_address(http_config.host),
      static_cast<unsigned short>(http_config.port)
    };
    auto api_handler = std::make_shared<conversion_service::RestApiHandler>(orchestrator, profiles);
    common::HttpServer http_server{ioc, http_endpoint, api_handler};

    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code& ec, int signo) {
      if (ec) {
        return;
      }
      LOG_INFO("Received signal " + std::to_string(signo) + ", shutting down");
      http_server.stop();
      ioc.stop();
    });

    http_server.run();
    ioc.run();

    orchestrator->shutdown();
    LOG_INFO("Shutdown complete");
    return 0;
  } catch (const std::exception& e) {
    LOG_ERROR(std::string("Fatal: ") + e.what());
    return 1;
  }
}
