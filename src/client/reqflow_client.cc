#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

// Third-party libraries
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <grpcpp/grpcpp.h>
#include <workflow.grpc.pb.h>

using reqflow_rpc::WorkflowService;

namespace {

bool ReadFile(const std::string& path, std::string* out) {
	std::ifstream file(path);
	if (!file.is_open()) {
		LOG(ERROR) << "Cannot open " << path;
		return false;
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	*out = buffer.str();
	return true;
}

std::string Basename(const std::string& path) {
	auto pos = path.find_last_of('/');
	return pos == std::string::npos ? path : path.substr(pos + 1);
}

void PrintEvent(const reqflow_rpc::WorkflowEvent& event) {
	std::cout << "#" << event.sequence_number() << " "
		<< reqflow_rpc::EventKind_Name(event.kind());
	// Protobuf maps iterate in no fixed order; print keys sorted.
	std::vector<std::string> keys;
	for (const auto& entry : event.payload()) keys.push_back(entry.first);
	std::sort(keys.begin(), keys.end());
	for (const auto& key : keys) {
		std::cout << " " << key << "=" << event.payload().at(key);
	}
	std::cout << std::endl;
}

void PrintSnapshot(const reqflow_rpc::RunSnapshot& run) {
	std::cout << "run " << run.correlation_id() << " phase=" << reqflow_rpc::Phase_Name(run.phase());
	if (!run.failure_reason().empty()) {
		std::cout << " failure=" << run.failure_reason() << " (" << run.failure_detail() << ")";
	}
	std::cout << " graph=" << run.graph_nodes() << "/" << run.graph_edges() << std::endl;
	for (const auto& requirement : run.requirements()) {
		std::cout << "  " << requirement.id() << " [" << reqflow_rpc::Verdict_Name(requirement.verdict());
		if (requirement.has_score()) std::cout << " " << requirement.score();
		std::cout << "] " << requirement.text() << std::endl;
	}
	for (const auto& question : run.questions()) {
		std::cout << "  ? " << question.question_id() << ": " << question.prompt() << std::endl;
	}
}

int Watch(WorkflowService::Stub* stub, const std::string& correlation_id) {
	grpc::ClientContext context;
	reqflow_rpc::SubscribeRequest request;
	request.set_correlation_id(correlation_id);
	std::unique_ptr<grpc::ClientReader<reqflow_rpc::WorkflowEvent>> reader(
			stub->Subscribe(&context, request));
	reqflow_rpc::WorkflowEvent event;
	while (reader->Read(&event)) {
		PrintEvent(event);
	}
	grpc::Status status = reader->Finish();
	if (!status.ok()) {
		LOG(ERROR) << "Subscribe failed: " << status.error_message();
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char* argv[]) {
	// Initialize logging
	google::InitGoogleLogging(argv[0]);
	google::InstallFailureSignalHandler();
	FLAGS_logtostderr = 1; // log only to console, no files.

	cxxopts::Options options("reqflow_client", "Reqflow workflow client");
	options.add_options()
		("l,log_level", "Log level", cxxopts::value<int>()->default_value("1"))
		("server", "Daemon address", cxxopts::value<std::string>()->default_value("127.0.0.1:50061"))
		("c,command", "submit, cancel, answer, watch or get",
		 cxxopts::value<std::string>()->default_value("get"))
		("i,id", "Correlation id of the run", cxxopts::value<std::string>())
		("d,document", "Source document file to mine", cxxopts::value<std::vector<std::string>>())
		("r,requirement", "Requirement text to validate", cxxopts::value<std::vector<std::string>>())
		("t,pass_threshold", "Pass threshold for this run", cxxopts::value<double>()->default_value("0"))
		("q,question", "Question id to answer", cxxopts::value<std::string>())
		("v,value", "Answer value: accept, reject or free text", cxxopts::value<std::string>())
		("f,follow", "Stream events after submit")
		("h,help", "Print usage");

	auto result = options.parse(argc, argv);
	if (result.count("help")) {
		std::cout << options.help() << std::endl;
		return EXIT_SUCCESS;
	}
	FLAGS_v = result["log_level"].as<int>();

	if (!result.count("id")) {
		LOG(ERROR) << "--id is required";
		return EXIT_FAILURE;
	}
	const std::string correlation_id = result["id"].as<std::string>();
	const std::string command = result["command"].as<std::string>();

	std::unique_ptr<WorkflowService::Stub> stub = WorkflowService::NewStub(
			grpc::CreateChannel(result["server"].as<std::string>(), grpc::InsecureChannelCredentials()));

	if (command == "submit") {
		reqflow_rpc::SubmitRequest request;
		request.set_correlation_id(correlation_id);
		if (result.count("document")) {
			for (const auto& path : result["document"].as<std::vector<std::string>>()) {
				std::string text;
				if (!ReadFile(path, &text)) return EXIT_FAILURE;
				auto* document = request.add_documents();
				document->set_id(Basename(path));
				document->set_text(text);
				document->set_source_ref(path);
			}
		}
		if (result.count("requirement")) {
			int n = 0;
			for (const auto& text : result["requirement"].as<std::vector<std::string>>()) {
				auto* requirement = request.add_requirements();
				requirement->set_id("REQ-" + std::to_string(++n));
				requirement->set_text(text);
				requirement->set_source_ref("cli");
			}
		}
		request.mutable_options()->set_pass_threshold(result["pass_threshold"].as<double>());

		grpc::ClientContext context;
		reqflow_rpc::SubmitResponse response;
		grpc::Status status = stub->Submit(&context, request, &response);
		if (!status.ok()) {
			LOG(ERROR) << "Submit failed: " << status.error_message();
			return EXIT_FAILURE;
		}
		std::cout << reqflow_rpc::SubmitResponse::Result_Name(response.result());
		if (!response.detail().empty()) std::cout << ": " << response.detail();
		std::cout << std::endl;
		if (response.result() != reqflow_rpc::SubmitResponse::ACCEPTED) return EXIT_FAILURE;
		return result.count("follow") ? Watch(stub.get(), correlation_id) : EXIT_SUCCESS;
	}

	if (command == "cancel") {
		grpc::ClientContext context;
		reqflow_rpc::CancelRequest request;
		reqflow_rpc::CancelResponse response;
		request.set_correlation_id(correlation_id);
		grpc::Status status = stub->Cancel(&context, request, &response);
		if (!status.ok()) {
			LOG(ERROR) << "Cancel failed: " << status.error_message();
			return EXIT_FAILURE;
		}
		std::cout << reqflow_rpc::CancelResponse::Result_Name(response.result()) << std::endl;
		return response.result() == reqflow_rpc::CancelResponse::OK ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	if (command == "answer") {
		if (!result.count("question") || !result.count("value")) {
			LOG(ERROR) << "answer needs --question and --value";
			return EXIT_FAILURE;
		}
		grpc::ClientContext context;
		reqflow_rpc::AnswerRequest request;
		reqflow_rpc::AnswerResponse response;
		request.set_correlation_id(correlation_id);
		request.set_question_id(result["question"].as<std::string>());
		request.set_value(result["value"].as<std::string>());
		grpc::Status status = stub->AnswerClarification(&context, request, &response);
		if (!status.ok()) {
			LOG(ERROR) << "AnswerClarification failed: " << status.error_message();
			return EXIT_FAILURE;
		}
		std::cout << reqflow_rpc::AnswerResponse::Result_Name(response.result()) << std::endl;
		return response.result() == reqflow_rpc::AnswerResponse::OK ? EXIT_SUCCESS : EXIT_FAILURE;
	}

	if (command == "watch") {
		return Watch(stub.get(), correlation_id);
	}

	if (command == "get") {
		grpc::ClientContext context;
		reqflow_rpc::GetRunRequest request;
		reqflow_rpc::RunSnapshot response;
		request.set_correlation_id(correlation_id);
		grpc::Status status = stub->GetRun(&context, request, &response);
		if (!status.ok()) {
			LOG(ERROR) << "GetRun failed: " << status.error_message();
			return EXIT_FAILURE;
		}
		PrintSnapshot(response);
		return EXIT_SUCCESS;
	}

	LOG(ERROR) << "Unknown command " << command;
	return EXIT_FAILURE;
}
