#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/globals.h"
#include "absl/log/initialize.h"

#include "suid/common/config.h"
#include "suid/host/host_id.h"
#include "suid/id/generator.h"
#include "suid/id/guid.h"
#include "suid/id/sequence_allocator.h"
#include "suid/id/suid.h"

ABSL_FLAG(std::string, config, "", "Path to a JSON config file");
ABSL_FLAG(std::string, kind, "suid", "Identifier kind: suid or guid");
ABSL_FLAG(int, count, 1, "Number of identifiers for the 'new' command");
ABSL_FLAG(int, group, -1, "GUID group (0-7); defaults to the config's default_group");
ABSL_FLAG(int, host_id, -1, "Host id; overrides config and environment when >= 0");

namespace {

absl::LogSeverityAtLeast ParseLogLevel(const std::string& level) {
    if (level == "warning") {
        return absl::LogSeverityAtLeast::kWarning;
    }
    if (level == "error") {
        return absl::LogSeverityAtLeast::kError;
    }
    return absl::LogSeverityAtLeast::kInfo;
}

int GenerateSuids(const suid::host::HostIdResolver& resolver, int count) {
    suid::SequenceAllocator allocator(suid::SuidGenerator::MaxSequence());
    auto generator = suid::SuidGenerator::Create(resolver, allocator);
    if (!generator.ok()) {
        std::cerr << generator.status() << std::endl;
        return 1;
    }
    for (int i = 0; i < count; ++i) {
        auto id = (*generator)->New();
        if (!id.ok()) {
            std::cerr << id.status() << std::endl;
            return 1;
        }
        std::cout << id->ToText() << "\t" << id->ToDecimal() << std::endl;
    }
    return 0;
}

int GenerateGuids(const suid::host::HostIdResolver& resolver, int count, uint64_t group) {
    suid::SequenceAllocator allocator(suid::GuidGenerator::MaxSequence());
    auto generator = suid::GuidGenerator::Create(resolver, allocator);
    if (!generator.ok()) {
        std::cerr << generator.status() << std::endl;
        return 1;
    }
    for (int i = 0; i < count; ++i) {
        auto id = (*generator)->New(group);
        if (!id.ok()) {
            std::cerr << id.status() << std::endl;
            return 1;
        }
        std::cout << id->ToText() << std::endl;
    }
    return 0;
}

// Prints the fields of `text`; with `verify_only` prints "valid"/"invalid"
// and reports the result through the exit code.
int Inspect(const std::string& kind, const std::string& text, bool verify_only) {
    std::string description;
    bool valid = false;
    if (kind == "guid") {
        auto id = suid::Guid::FromText(text);
        if (!id.ok()) {
            std::cerr << id.status() << std::endl;
            return 1;
        }
        description = id->Description();
        valid = id->Verify();
    } else {
        auto id = suid::Suid::FromText(text);
        if (!id.ok()) {
            std::cerr << id.status() << std::endl;
            return 1;
        }
        description = id->Description();
        valid = id->Verify();
    }

    if (verify_only) {
        std::cout << (valid ? "valid" : "invalid") << std::endl;
        return valid ? 0 : 2;
    }
    std::cout << description << (valid ? "" : " (fails verification)") << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    absl::SetProgramUsageMessage(
        "Sortable unique identifier tool.\n\n"
        "Usage:\n"
        "  suid-cli [flags] [command] [args...]\n\n"
        "Commands:\n"
        "  new               Generate --count identifiers (default)\n"
        "  parse <text>      Decode an identifier and print its fields\n"
        "  verify <text>     Exit 0 if the identifier passes the sanity check\n\n"
        "Examples:\n"
        "  suid-cli --count 5\n"
        "  suid-cli --kind guid --group 2 new\n"
        "  suid-cli --kind guid parse 3cdgh1ab2k4mn5pq\n"
        "  suid-cli --config ~/.config/suid.json --host_id 7");
    std::vector<char*> args = absl::ParseCommandLine(argc, argv);

    absl::InitializeLog();

    suid::Config config;
    const std::string config_path = absl::GetFlag(FLAGS_config);
    if (!config_path.empty()) {
        auto status = config.Load(config_path);
        if (!status.ok()) {
            std::cerr << status << std::endl;
            return 1;
        }
    }
    absl::SetStderrThreshold(ParseLogLevel(config.GetLogLevel()));

    if (absl::GetFlag(FLAGS_host_id) >= 0) {
        config.SetHostId(static_cast<uint64_t>(absl::GetFlag(FLAGS_host_id)));
    }
    if (absl::GetFlag(FLAGS_group) >= 0) {
        auto status = config.SetDefaultGroup(static_cast<uint64_t>(absl::GetFlag(FLAGS_group)));
        if (!status.ok()) {
            std::cerr << status << std::endl;
            return 1;
        }
    }

    const std::string kind = absl::GetFlag(FLAGS_kind);
    if (kind != "suid" && kind != "guid") {
        std::cerr << "Unknown kind: " << kind << std::endl;
        return 1;
    }

    std::string command = "new";
    if (args.size() > 1) {
        command = args[1];
    }

    if (command == "new") {
        const int count = absl::GetFlag(FLAGS_count);
        suid::host::EnvironmentHostIdResolver resolver(config.ToHostIdOptions());
        if (kind == "guid") {
            return GenerateGuids(resolver, count, config.GetDefaultGroup());
        }
        return GenerateSuids(resolver, count);
    }

    if (command == "parse" || command == "verify") {
        if (args.size() < 3) {
            std::cerr << "Usage: suid-cli [--kind suid|guid] " << command << " <text>" << std::endl;
            return 1;
        }
        return Inspect(kind, args[2], command == "verify");
    }

    std::cerr << "Unknown command: " << command << std::endl;
    return 1;
}
