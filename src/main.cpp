#include "styleverify/core/Exception.hpp"
#include "styleverify/reader/DocxContextExtractor.hpp"
#include "styleverify/repository/InMemoryTemplateRepository.hpp"
#include "styleverify/service/TemplateRegistrar.hpp"
#include "styleverify/service/VerificationService.hpp"
#include "styleverify/utils/Logger.hpp"
#include "styleverify/utils/ModuleLoggers.hpp"
#include "styleverify/utils/TimeUtils.hpp"
#include <fmt/format.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace styleverify;

namespace {

constexpr int kExitMatch = 0;
constexpr int kExitMismatches = 1;
constexpr int kExitFailed = 2;
constexpr int kExitUsage = 64;

struct CliOptions {
    std::string template_path;
    std::string document_path;
    std::string log_file;
    Logger::Level log_level = Logger::Level::WARN;
    bool list_styles = false;
    verify::VerificationOptions verification;
};

void printUsage(const char* program) {
    fmt::print(
        "Usage: {} [options] <template.docx> <document.docx>\n"
        "\n"
        "Options:\n"
        "  --lenient              use the lenient numeric tolerance (1.0pt)\n"
        "  --ignore-type <type>   skip styles of the given type (repeatable)\n"
        "  --threads <n>          worker threads for pair comparison (0 = auto)\n"
        "  --sequential           compare pairs on the calling thread\n"
        "  --list-styles          print the template style catalog before the report\n"
        "  --log-level <level>    trace|debug|info|warn|error|critical|off\n"
        "  --log-file <path>      also write the log to a file\n"
        "  -h, --help             show this help\n",
        program);
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    std::vector<std::string> positional;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto requireValue = [&](const char* flag) -> const char* {
            if (i + 1 >= argc) {
                fmt::print(stderr, "error: {} requires a value\n", flag);
                return nullptr;
            }
            return argv[++i];
        };

        if (arg == "--lenient") {
            options.verification.strict_mode = false;
        } else if (arg == "--sequential") {
            options.verification.parallel = false;
        } else if (arg == "--list-styles") {
            options.list_styles = true;
        } else if (arg == "--ignore-type") {
            const char* value = requireValue("--ignore-type");
            if (!value) return false;
            auto type = core::parseStyleType(value);
            if (!type) {
                fmt::print(stderr, "error: unknown style type '{}'\n", value);
                return false;
            }
            options.verification.ignore_style_types.push_back(*type);
        } else if (arg == "--threads") {
            const char* value = requireValue("--threads");
            if (!value) return false;
            char* end = nullptr;
            long threads = std::strtol(value, &end, 10);
            if (end == value || *end != '\0' || threads < 0) {
                fmt::print(stderr, "error: invalid thread count '{}'\n", value);
                return false;
            }
            options.verification.worker_threads = static_cast<size_t>(threads);
        } else if (arg == "--log-level") {
            const char* value = requireValue("--log-level");
            if (!value) return false;
            options.log_level = Logger::parseLevel(value);
        } else if (arg == "--log-file") {
            const char* value = requireValue("--log-file");
            if (!value) return false;
            options.log_file = value;
        } else if (!arg.empty() && arg[0] == '-') {
            fmt::print(stderr, "error: unknown option '{}'\n", arg);
            return false;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() != 2) {
        return false;
    }
    options.template_path = positional[0];
    options.document_path = positional[1];
    return true;
}

core::Result<std::vector<uint8_t>> readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return core::makeError(core::ErrorCode::FileNotFound, "cannot open file", path);
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::makeError(core::ErrorCode::FileReadError, "read failed", path);
    }
    return bytes;
}

void printStyleDetails(const repository::TemplateStyleDetails& details) {
    fmt::print("Template styles: {} (version {})\n", details.template_name, details.version);
    fmt::print("  contexts : {}\n", details.totalStyles());
    fmt::print("  catalog  : {}\n", details.totalDefaultStyles());
    for (const auto& style : details.default_styles) {
        fmt::print("    {:<24} {:<10} based on '{}'{}{}\n", style.style_id, core::toString(style.type),
                   style.based_on, style.is_default ? " [default]" : "", style.is_custom ? " [custom]" : "");
    }
    fmt::print("  numbering: {}\n", details.totalNumberingDefinitions());
    for (const auto& numbering : details.numbering_definitions) {
        fmt::print("    #{} {} ({}, numId {}, {} levels)\n", numbering.abstract_num_id, numbering.name,
                   numbering.type, numbering.numbering_id, numbering.levels.size());
    }
    fmt::print("\n");
}

void printReport(const core::VerificationResult& result) {
    fmt::print("Template : {} (version {})\n", result.template_name, result.template_version);
    fmt::print("Document : {}\n", result.document_name);
    fmt::print("Verified : {}\n", utils::TimeUtils::formatISO8601(result.getVerificationDate()));
    fmt::print("Status   : {}\n", core::toString(result.getStatus()));

    if (result.getStatus() == core::VerificationStatus::Failed) {
        fmt::print("Error    : {} ({})\n", result.getErrorMessage(),
                   core::errorCodeName(result.getErrorCode()));
        return;
    }

    for (const auto& warning : result.warnings) {
        fmt::print("Warning  : {}\n", warning);
    }

    fmt::print("Mismatches: {}\n", result.getTotalMismatches());
    for (const auto& m : result.getMismatches()) {
        fmt::print("\n#{} [{}] {} at {}\n", m.id, core::toString(m.severity),
                   core::toString(m.category), m.location);
        fmt::print("  context : {} ({})\n", m.context_key, m.structural_role);
        fmt::print("  fields  : {}\n", m.mismatchFields());
        fmt::print("  expected: {}\n", m.expected);
        fmt::print("  actual  : {}\n", m.actual);
        if (!m.sample_text.empty()) {
            fmt::print("  text    : \"{}\"\n", m.sample_text);
        }
        fmt::print("  action  : {}\n", m.recommended_action);
    }
}

int run(const CliOptions& options) {
    // 读取失败抛出 FileException，由 main 统一处理
    const std::vector<uint8_t> template_bytes = readFile(options.template_path).valueOrThrow();
    const std::vector<uint8_t> document_bytes = readFile(options.document_path).valueOrThrow();

    auto repository = std::make_shared<repository::InMemoryTemplateRepository>();
    auto extractor = std::make_shared<reader::DocxContextExtractor>();

    const std::string template_file = std::filesystem::path(options.template_path).filename().string();
    const std::string template_name = std::filesystem::path(options.template_path).stem().string();
    const std::string document_name = std::filesystem::path(options.document_path).filename().string();

    service::TemplateRegistrar registrar(repository, extractor);
    auto template_id = registrar.registerTemplate(template_name, template_file, template_bytes, "cli");
    if (!template_id) {
        fmt::print(stderr, "error: cannot load template: {}\n", template_id.error().fullMessage());
        return kExitFailed;
    }

    if (options.list_styles) {
        printStyleDetails(repository->getTemplateStyleDetails(*template_id).valueOrThrow());
    }

    service::VerificationService service(repository, extractor, options.verification);
    auto result = service.verify(template_name, document_name, document_bytes, "cli");
    if (!result) {
        fmt::print(stderr, "error: {}\n", result.error().fullMessage());
        return kExitFailed;
    }

    printReport(*result);
    if (result->getStatus() != core::VerificationStatus::Completed) {
        return kExitFailed;
    }
    return result->getTotalMismatches() == 0 ? kExitMatch : kExitMismatches;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CliOptions options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return kExitMatch;
        }
    }
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return kExitUsage;
    }

    Logger::getInstance().initialize(options.log_file, options.log_level, true);
    CLI_INFO("Verifying '{}' against '{}'", options.document_path, options.template_path);

    int exit_code = kExitFailed;
    try {
        exit_code = run(options);
    } catch (const core::StyleVerifyException& e) {
        CLI_ERROR("Verification aborted: {}", e.getDetailedMessage());
        fmt::print(stderr, "error: {}\n", e.what());
    } catch (const std::exception& e) {
        CLI_ERROR("Unexpected error: {}", e.what());
        fmt::print(stderr, "error: {}\n", e.what());
    }

    Logger::getInstance().flush();
    Logger::getInstance().shutdown();
    return exit_code;
}
