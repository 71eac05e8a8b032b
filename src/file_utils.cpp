#include "file_utils.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

// Читает файл блоками по 1 МБ и считает символы новой строки
std::size_t countLinesInFile(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw std::runtime_error("Не удалось открыть файл для подсчета строк: " + path.string());
    }

    constexpr std::size_t bufferSize = 1024 * 1024;
    std::vector<char> buffer(bufferSize);

    std::size_t lineCount = 0;
    char lastChar = '\n';
    while (input.read(buffer.data(), bufferSize) || input.gcount() > 0) {
        auto bytesRead = static_cast<std::size_t>(input.gcount());
        lineCount += std::count(buffer.begin(), buffer.begin() + bytesRead, '\n');
        lastChar = buffer[bytesRead - 1];
    }

    // Последняя строка без \n
    if (lastChar != '\n') {
        ++lineCount;
    }
    return lineCount;
}

std::filesystem::path findProjectRoot() {
    std::error_code error;
    std::filesystem::path current = std::filesystem::current_path();

    while (!current.empty()) {
        if (std::filesystem::is_directory(current / "tests", error) ||
            std::filesystem::is_regular_file(current / "CMakeLists.txt", error)) {
            return current;
        }

        std::filesystem::path parent = current.parent_path();
        if (parent == current) {
            break; // Корень файловой системы
        }
        current = parent;
    }

    return std::filesystem::current_path();
}

std::filesystem::path findDataDirectory() {
    return findProjectRoot() / "tests" / "data";
}

namespace {
// Сравнение расширений без учета регистра
bool hasExtension(const std::filesystem::path& path, std::string ext) {
    std::string pathExt = path.extension().string();
    auto lower = [](std::string& text) {
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    };
    lower(pathExt);
    lower(ext);
    return !pathExt.empty() && pathExt == ext;
}
}

std::vector<std::filesystem::path> findTxtFiles(const std::filesystem::path& directory) {
    std::vector<std::filesystem::path> txtFiles;
    std::error_code error;
    if (!std::filesystem::is_directory(directory, error)) {
        return txtFiles;
    }

    for (const auto& entry : std::filesystem::directory_iterator(directory, error)) {
        if (entry.is_regular_file(error) && hasExtension(entry.path(), ".txt")) {
            txtFiles.push_back(entry.path());
        }
    }

    std::sort(txtFiles.begin(), txtFiles.end());
    return txtFiles;
}

std::string getCurrentTimeString() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf;

#ifdef _WIN32
    localtime_s(&tm_buf, &time);
#else
    localtime_r(&time, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y%m%d_%H%M%S");
    return oss.str();
}
