#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <pthread.h>
#include <sys/stat.h>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>

// Project includes
#include "capabilities/synthetic_capability.h"
#include "common/configuration.h"
#include "orchestrator/workflow_orchestrator.h"
#include "rpc/workflow_service.h"

namespace {

bool FileExists(const std::string& path) {
	struct stat st;
	return stat(path.c_str(), &st) == 0;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();

	cxxopts::Options options("reqflowd", "Requirements mining and validation workflow daemon");
	options.allow_unrecognised_options();
	options.add_options()
		("config", "YAML configuration file",
		 cxxopts::value<std::string>()->default_value("config/reqflow.yaml"))
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("help", "Print usage. Also accepts --port, --pass-threshold, --item-timeout-ms, "
		 "--max-attempts and --synthetic-latency-ms");

	auto arguments = options.parse(argc, argv);
	if (arguments.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}

	FLAGS_v = arguments["log_level"].as<int>();
	FLAGS_logtostderr = 1; // log only to console, no files

	// *************** Configuration **********************
	Reqflow::Configuration& config = Reqflow::Configuration::getInstance();
	const std::string config_path = arguments["config"].as<std::string>();
	if (FileExists(config_path)) {
		if (!config.loadFromFile(config_path)) {
			LOG(ERROR) << "Unusable configuration " << config_path;
			return EXIT_FAILURE;
		}
	} else {
		LOG(WARNING) << "Configuration " << config_path << " not found, using defaults";
	}
	config.overrideFromCommandLine(argc, argv);
	if (!config.validate()) {
		for (const auto& error : config.getValidationErrors()) {
			LOG(ERROR) << "Invalid configuration: " << error;
		}
		return EXIT_FAILURE;
	}
	const Reqflow::ReqflowConfig& cfg = config.config();

	// SIGINT/SIGTERM are taken by a dedicated thread; block them before any other thread starts.
	sigset_t stop_signals;
	sigemptyset(&stop_signals);
	sigaddset(&stop_signals, SIGINT);
	sigaddset(&stop_signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &stop_signals, nullptr);

	// *************** Orchestrator **********************
	Reqflow::SyntheticOptions synthetic;
	synthetic.latency = std::chrono::milliseconds(cfg.synthetic.latency_ms.get());
	synthetic.transient_failure_rate = cfg.synthetic.transient_failure_rate.get();
	synthetic.seed = static_cast<uint32_t>(cfg.synthetic.seed.get());
	Reqflow::SyntheticCapability capability(synthetic);
	LOG(WARNING) << "Using the synthetic requirements capability (latency "
		<< synthetic.latency.count() << "ms, failure rate " << synthetic.transient_failure_rate << ")";

	Reqflow::OrchestratorOptions orchestrator_options;
	orchestrator_options.replay_buffer = config.getReplayBufferSize();
	orchestrator_options.channel_grace = std::chrono::milliseconds(cfg.events.channel_grace_ms.get());
	orchestrator_options.reap_interval = std::chrono::milliseconds(cfg.events.reap_interval_ms.get());
	Reqflow::WorkflowOrchestrator orchestrator(capability, orchestrator_options);

	// *************** gRPC server **********************
	Reqflow::WorkflowServiceImpl service(orchestrator, config.DefaultWorkflowConfig());
	const std::string address = config.getServerAddress();
	grpc::ServerBuilder builder;
	builder.AddListeningPort(address, grpc::InsecureServerCredentials());
	builder.RegisterService(&service);
	std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
	if (!server) {
		LOG(ERROR) << "Failed to start the workflow service on " << address;
		return EXIT_FAILURE;
	}
	LOG(INFO) << "reqflowd listening on " << address;

	std::thread signal_thread([&server, &stop_signals]() {
			int signal = 0;
			if (sigwait(&stop_signals, &signal) == 0) {
				LOG(INFO) << "Received signal " << signal << ", shutting down";
			}
			server->Shutdown();
			});

	// *************** Wait unless there's a failure **********************
	server->Wait();
	orchestrator.Shutdown();
	if (signal_thread.joinable()) {
		signal_thread.join();
	}

	LOG(INFO) << "reqflowd terminating";
	return EXIT_SUCCESS;
}
