#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <absl/flags/usage.h>
#include <absl/log/globals.h>
#include <absl/log/initialize.h>
#include <absl/strings/str_split.h>

#include "tether/client/connection.h"
#include "tether/client/initializer.h"
#include "tether/client/remote_model.h"
#include "tether/client/signature.h"
#include "tether/common/error.h"
#include "tether/sample.pb.h"

namespace {

std::string ExpandPath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr) {
        return path;
    }
    if (path.size() == 1) {
        return std::string(home);
    }
    if (path[1] == '/') {
        return std::string(home) + path.substr(1);
    }
    return path;
}

int Fail(const absl::Status& status) {
    std::cerr << "Error (" << tether::ErrorKindName(tether::GetErrorKind(status))
              << "): " << status.message() << std::endl;
    if (auto http_status = tether::GetHttpStatus(status)) {
        std::cerr << "HTTP status: " << *http_status << std::endl;
    }
    if (auto delivered = tether::GetDeliveredCount(status)) {
        std::cerr << "Delivered before failure: " << *delivered << std::endl;
    }
    return 1;
}

tether::sample::SampleInput MakeInput(const std::string& name) {
    tether::sample::SampleInput input;
    input.set_name(name);
    return input;
}

std::string GreetingOf(const google::protobuf::Message& message) {
    const auto* field = message.GetDescriptor()->FindFieldByName("greeting");
    if (field == nullptr) {
        return message.ShortDebugString();
    }
    return message.GetReflection()->GetString(message, field);
}

}  // namespace

ABSL_FLAG(std::string, connection, "~/.config/tether/connection.json",
          "Path to the connection-info JSON document");
ABSL_FLAG(std::string, target, "sample-greeter", "Remote model id");
ABSL_FLAG(std::string, name, "World",
          "Name to greet; comma-separated list for --mode=stream_in");
ABSL_FLAG(std::string, mode, "unary", "Call shape: unary, stream_in or stream_out");
ABSL_FLAG(int, timeout_ms, 0, "Per-call timeout in milliseconds (0 keeps the connection's)");
ABSL_FLAG(bool, verbose, false, "Log call lifecycle to stderr");

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "tether_call: call the sample greeting model on a remote server.\n\n"
        "Usage:\n"
        "  tether_call --connection <file> [--mode unary|stream_in|stream_out] [--name <names>]\n\n"
        "Examples:\n"
        "  tether_call --connection grpc.json --name Test\n"
        "  tether_call --connection http.json --mode stream_in --name Test1,Test2,Test3\n"
        "  tether_call --connection https.json --mode stream_out --name Test");
    absl::ParseCommandLine(argc, argv);

    absl::InitializeLog();
    absl::SetStderrThreshold(absl::GetFlag(FLAGS_verbose) ? absl::LogSeverityAtLeast::kInfo
                                                          : absl::LogSeverityAtLeast::kWarning);

    auto connection = tether::LoadConnectionDescriptor(ExpandPath(absl::GetFlag(FLAGS_connection)));
    if (!connection.ok()) {
        return Fail(connection.status());
    }

    const auto* service = tether::sample::SampleInput::descriptor()->file()->FindServiceByName(
        "SampleTaskService");
    auto signature = tether::TargetSignature::FromService(service, absl::GetFlag(FLAGS_target));
    if (!signature.ok()) {
        return Fail(signature.status());
    }

    tether::InitializerConfig config;
    if (absl::GetFlag(FLAGS_timeout_ms) > 0) {
        config.default_timeout = std::chrono::milliseconds(absl::GetFlag(FLAGS_timeout_ms));
    }
    tether::RemoteModelInitializer initializer(config, "tether_call");
    auto model = initializer.Init(*signature, *connection);
    if (!model.ok()) {
        return Fail(model.status());
    }

    const std::string mode = absl::GetFlag(FLAGS_mode);
    const std::string name = absl::GetFlag(FLAGS_name);

    if (mode == "unary") {
        auto output = (*model)->Run("Predict", MakeInput(name));
        if (!output.ok()) {
            return Fail(output.status());
        }
        std::cout << GreetingOf(**output) << std::endl;
    } else if (mode == "stream_in") {
        std::vector<tether::sample::SampleInput> inputs;
        for (absl::string_view part : absl::StrSplit(name, ',', absl::SkipEmpty())) {
            inputs.push_back(MakeInput(std::string(part)));
        }
        tether::VectorInputStream<tether::sample::SampleInput> stream(std::move(inputs));
        auto output = (*model)->RunStreamIn("PredictStreamIn", stream);
        if (!output.ok()) {
            return Fail(output.status());
        }
        std::cout << GreetingOf(**output) << std::endl;
    } else if (mode == "stream_out") {
        auto stream = (*model)->RunStreamOut("PredictStreamOut", MakeInput(name));
        if (!stream.ok()) {
            return Fail(stream.status());
        }
        while (true) {
            auto next = (*stream)->Next();
            if (!next.ok()) {
                return Fail(next.status());
            }
            if (*next == nullptr) {
                break;
            }
            std::cout << GreetingOf(**next) << std::endl;
        }
    } else {
        std::cerr << "Unknown mode: " << mode << std::endl;
        return 1;
    }
    return 0;
}
