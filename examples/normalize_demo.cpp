#include <cstring>

#include <iostream>
#include <string>
#include <vector>

#include "vntn_api.hpp"

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项] [文本 ...]\n"
        << "\n"
        << "选项:\n"
        << "  -f             完整分组读法 (2023 -> hai nghìn không trăm hai mươi ba)\n"
        << "  -v             显示每个匹配的替换过程\n"
        << "  -h             显示帮助\n"
        << "\n"
        << "交互模式:\n"
        << "  不带文本参数时从标准输入逐行读取并输出规范化结果\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << " \"Ngày 15/03/2023 lúc 10:30\"\n"
        << "  " << program << " -f \"Năm 2023 có 1.005 người\"\n"
        << "  " << program << " -v \"2023-01-05 10:30:00\"\n"
        << "  echo \"Mã 22T583XYZ\" | " << program << "\n"
        << std::endl;
}

void normalizeLine(const Vntn::Normalizer& normalizer, const std::string& line, bool show_trace) {
    if (!show_trace) {
        std::cout << normalizer.Normalize(line) << std::endl;
        return;
    }

    std::vector<Vntn::MatchInfo> trace;
    std::string result = normalizer.NormalizeWithTrace(line, trace);

    for (const auto& m : trace) {
        std::cout << "  [" << m.type << "] @" << m.start << " '" << m.original
            << "' -> '" << m.normalized << "'" << std::endl;
    }
    std::cout << result << std::endl;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> texts;
    bool full_groups = false;
    bool show_trace = false;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "-f") == 0) {
            full_groups = true;
        } else if (strcmp(argv[i], "-v") == 0) {
            show_trace = true;
        } else {
            texts.push_back(argv[i]);
        }
    }

    Vntn::NormalizerOptions options = Vntn::NormalizerOptions::Default()
        .withFullGroups(full_groups);
    Vntn::Normalizer normalizer(options);

    if (!normalizer.IsValid()) {
        std::cerr << "Error: " << normalizer.GetLastError() << std::endl;
        return 1;
    }

    if (!texts.empty()) {
        // 直接模式
        for (const auto& text : texts) {
            normalizeLine(normalizer, text, show_trace);
        }
        return 0;
    }

    // 交互模式
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "q" || line == "quit" || line == "exit") {
            break;
        }
        normalizeLine(normalizer, line, show_trace);
    }

    return 0;
}
