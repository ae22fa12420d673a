#include "DatasetLoader.h"
#include "CommonUtils.h"
#include "VeritasExceptions.h"

#include <atomic>
#include <cstdlib>
#include <ctime>
#include <fcntl.h>
#include <functional>
#include <filesystem>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace {
std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath) {
    const int outFd = ::open(outputPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0600);
    if (outFd < 0) return -1;

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outFd);
        return -1;
    }

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }
        if (::dup2(outFd, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::close(outFd);

        std::vector<char*> argv;
        argv.reserve(args.size() + 2);
        argv.push_back(const_cast<char*>(executable.c_str()));
        for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(outFd);
    int status = 0;
    if (::waitpid(pid, &status, 0) < 0) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

struct TempFileGuard {
    std::string path;
    ~TempFileGuard() {
        if (path.empty()) return;
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
};

std::string temporaryCsvPath(const std::string& sourcePath) {
    static std::atomic<unsigned long long> counter{0};
    const unsigned long long salt = std::hash<std::string>{}(sourcePath + std::to_string(std::time(nullptr)));
    const auto name = "veritas_input_" + std::to_string(static_cast<unsigned long long>(::getpid())) + "_" +
                      std::to_string(salt) + "_" + std::to_string(counter.fetch_add(1)) + ".csv";
    return (std::filesystem::temp_directory_path() / name).string();
}

void convertWorkbook(const std::string& tool, const std::string& sourcePath, const std::string& tmpPath) {
    const std::string exe = findExecutableInPath(tool);
    if (exe.empty()) {
        throw Veritas::DatasetException("Excel import requires " + tool + " on PATH");
    }
    if (spawnToFile(exe, {sourcePath}, tmpPath) != 0) {
        throw Veritas::DatasetException("Failed to convert workbook: " + sourcePath);
    }
}
} // namespace

namespace DatasetLoader {

SourceFormat detectFormat(const std::string& originalName) {
    const std::string ext = CommonUtils::toLower(std::filesystem::path(originalName).extension().string());
    if (ext == ".csv") return SourceFormat::CSV;
    if (ext == ".xlsx") return SourceFormat::XLSX;
    if (ext == ".xls") return SourceFormat::XLS;
    throw Veritas::UnsupportedFormatException(ext);
}

std::shared_ptr<const TypedDataset> load(const std::string& path,
                                         const std::string& originalName,
                                         const LoadOptions& options) {
    const SourceFormat format = detectFormat(originalName.empty() ? path : originalName);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw Veritas::IOException("Could not open file: " + path);
    }

    TempFileGuard guard;
    std::string csvPath = path;
    char delimiter = options.delimiter;
    if (format != SourceFormat::CSV) {
        guard.path = temporaryCsvPath(path);
        convertWorkbook(format == SourceFormat::XLSX ? "xlsx2csv" : "xls2csv", path, guard.path);
        csvPath = guard.path;
        delimiter = ',';
    }

    auto data = std::make_shared<TypedDataset>(csvPath, delimiter);
    data->setNumericSeparatorPolicy(options.numericSeparatorPolicy);
    data->setDateLocaleHint(options.dateLocaleHint);
    data->setParseLimits(options.csvLimits);
    data->load();
    return data;
}

} // namespace DatasetLoader
