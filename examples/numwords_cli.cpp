#include <cstring>

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "numwords_api.hpp"

// 模式名: {name, mode}
static const std::vector<std::pair<std::string, NumWords::NumberMode>> kModeNames = {
    {"cardinal", NumWords::NumberMode::CARDINAL},
    {"ordinal",  NumWords::NumberMode::ORDINAL},
    {"currency", NumWords::NumberMode::CURRENCY},
    {"decimal",  NumWords::NumberMode::DECIMAL},
    {"roman",    NumWords::NumberMode::ROMAN},
};

bool parseMode(const std::string& name, NumWords::NumberMode& mode) {
    for (const auto& [mode_name, value] : kModeNames) {
        if (mode_name == name) {
            mode = value;
            return true;
        }
    }
    return false;
}

std::string modeName(NumWords::NumberMode mode) {
    for (const auto& [mode_name, value] : kModeNames) {
        if (value == mode) {
            return mode_name;
        }
    }
    return "unknown";
}

void printUsage(const char* program) {
    std::cout << "用法: " << program << " [选项]\n"
        << "\n"
        << "选项:\n"
        << "  -p <number>        直接转换指定数字\n"
        << "  -m <mode>          输出模式 (默认: cardinal)\n"
        << "  -l <lang>          语言 (默认: en)\n"
        << "  --lower-roman      罗马数字输出小写\n"
        << "  --no-roman-input   不把输入识别为罗马数字\n"
        << "  --list-languages   列出支持的语言\n"
        << "  -h                 显示帮助\n"
        << "\n"
        << "模式:\n"
        << "  cardinal       基数词, 含小数点的输入按小数读 (仅英语)\n"
        << "  ordinal        基数词 + 序数标记, 如 Twenty One (21st)\n"
        << "  currency       美元金额, 如 Two Dollars and Forty Five Cents\n"
        << "  decimal        小数, 保留两位\n"
        << "  roman          罗马数字 (1-3999)\n"
        << "\n"
        << "交互模式:\n"
        << "  不带 -p 参数时进入交互模式，输入数字后按 Enter 转换\n"
        << "  :mode <mode>   切换模式\n"
        << "  :lang <lang>   切换语言\n"
        << "  输入 'q' 或 'quit' 退出\n"
        << "\n"
        << "示例:\n"
        << "  " << program << "                           # 交互模式\n"
        << "  " << program << " -p 1234567                # 英文基数词\n"
        << "  " << program << " -p 21 -l es               # 西班牙语\n"
        << "  " << program << " -p 2.45 -m currency       # 货币\n"
        << "  " << program << " -p 1994 -m roman          # 罗马数字\n"
        << "  " << program << " -p XLII                   # 罗马数字输入\n"
        << std::endl;
}

void printLanguageList() {
    std::cout << "支持的语言:\n"
        << "\n";
    for (const auto& lang : NumWords::Converter::GetSupportedLanguages()) {
        std::cout << "  " << lang.code << "  " << lang.iso3 << "  " << lang.name << "\n";
    }
    std::cout << "\n"
        << "用法: -l <lang>  支持短代码 (es)、ISO 代码 (spa) 和英文名 (spanish)\n"
        << "非英语仅支持基数词模式\n"
        << std::endl;
}

bool convert(const NumWords::Converter& converter, const std::string& input) {
    auto result = converter.Call(input);

    if (!result || !result->IsSuccess()) {
        std::cerr << "转换失败";
        if (result) {
            std::cerr << ": [" << result->GetCode() << "] " << result->GetMessage();
            if (!result->GetDetail().empty()) {
                std::cerr << " (" << result->GetDetail() << ")";
            }
        }
        std::cerr << std::endl;
        return false;
    }

    std::cout << result->GetText() << std::endl;
    return true;
}

// 处理交互命令 (":mode <m>", ":lang <code>")
void handleCommand(NumWords::Converter& converter, const std::string& line) {
    auto space = line.find(' ');
    std::string command = (space != std::string::npos) ? line.substr(0, space) : line;
    std::string argument = (space != std::string::npos) ? line.substr(space + 1) : "";

    if (command == ":mode") {
        NumWords::NumberMode mode;
        if (!parseMode(argument, mode)) {
            std::cerr << "错误: 未知模式 '" << argument << "'\n"
                << "可用模式: cardinal, ordinal, currency, decimal, roman" << std::endl;
            return;
        }
        converter.SetMode(mode);
        std::cout << "模式: " << modeName(mode) << std::endl;
        if (!converter.IsValid()) {
            std::cerr << "Warning: 当前语言不支持该模式, 转换将失败" << std::endl;
        }
        return;
    }

    if (command == ":lang") {
        if (converter.SetLanguage(argument)) {
            std::cout << "语言: " << argument << std::endl;
            if (!converter.IsValid()) {
                std::cerr << "Warning: 该语言不支持当前模式, 转换将失败" << std::endl;
            }
        }
        return;
    }

    std::cerr << "错误: 未知命令 '" << command << "'\n"
        << "可用命令: :mode <mode>, :lang <lang>" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string input;
    NumWords::ConvertConfig config;
    bool interactive = true;

    // 解析参数
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (strcmp(argv[i], "--list-languages") == 0) {
            printLanguageList();
            return 0;
        } else if (strcmp(argv[i], "-p") == 0 && i + 1 < argc) {
            input = argv[++i];
            interactive = false;
        } else if (strcmp(argv[i], "-m") == 0 && i + 1 < argc) {
            const char* name = argv[++i];
            if (!parseMode(name, config.mode)) {
                std::cerr << "错误: 未知模式 '" << name << "'\n"
                    << "可用模式: cardinal, ordinal, currency, decimal, roman\n";
                return 1;
            }
        } else if (strcmp(argv[i], "-l") == 0 && i + 1 < argc) {
            config.language = argv[++i];
        } else if (strcmp(argv[i], "--lower-roman") == 0) {
            config.lowercase_roman = true;
        } else if (strcmp(argv[i], "--no-roman-input") == 0) {
            config.accept_roman_input = false;
        } else {
            std::cerr << "警告: 忽略未知参数 '" << argv[i] << "'" << std::endl;
        }
    }

    NumWords::Converter converter(config);

    if (!converter.IsValid()) {
        std::cerr << "转换器初始化失败!" << std::endl;
        return 1;
    }

    if (!interactive) {
        return convert(converter, input) ? 0 : 1;
    }

    // 交互模式
    std::cout << "语言: " << config.language << "  模式: " << modeName(config.mode) << std::endl;
    std::cout << "进入交互模式，输入数字后按 Enter 转换 (输入 q 退出)" << std::endl;
    std::cout << "----------------------------------------" << std::endl;

    std::string line;
    while (true) {
        std::cout << "> ";
        if (!std::getline(std::cin, line)) {
            std::cout << std::endl;
            break;
        }

        if (line.empty()) {
            continue;
        }

        if (line == "q" || line == "quit" || line == "exit") {
            std::cout << "再见!" << std::endl;
            break;
        }

        if (line[0] == ':') {
            handleCommand(converter, line);
            continue;
        }

        convert(converter, line);
    }

    return 0;
}
