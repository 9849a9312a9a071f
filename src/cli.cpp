#include "cli.hpp"
#include <cstring>
#include <iomanip>
#include <stdexcept>
#include <string>
#include <vector>
#include <getopt.h>
#include "vecanalogy.hpp"

namespace vecanalogy {

namespace {

const char* const kDefaultTable = "glove.6B.50d.txt";

enum LongOnlyOption {
    kOptCosine = 256,
    kOptEuclidean,
};

void PrintUsage(std::ostream& os, const char* prog_name) {
    os << "vecanalogy - word vector analogies\n\n";
    os << "Usage:\n";
    os << "  " << prog_name << " [options] <table> word1 [+|-] word2 ...\n";
    os << "  " << prog_name << " [options] -f <table> word1 [+|-] word2 ...\n";
    os << "  " << prog_name << " [options] <table> -- -lrb- ...\n\n";
    os << "Options:\n";
    os << "  -f, --file <file>       词向量文件路径 (默认: 第一个位置参数)\n";
    os << "  -F, --default-table     使用 " << kDefaultTable << "\n";
    os << "  -m, --mode <mode>       sum | average | expression (默认: expression)\n";
    os << "  -M, --metric <metric>   cosine | euclidean (默认: cosine)\n";
    os << "      --cosine            等同于 --metric cosine\n";
    os << "      --euclidean         等同于 --metric euclidean\n";
    os << "  -d, --dim <int>         期望的向量维度 (默认: 由第一行确定)\n";
    os << "  -l, --lenient           跳过格式错误的行 (默认: 遇到即失败)\n";
    os << "  -k, --top <int>         输出的近邻数量 (默认: 1)\n";
    os << "  -p, --threads <int>     搜索线程数 (默认: 1, 不超过 CPU 核数)\n";
    os << "  -i, --include-inputs    结果中不排除输入的词\n";
    os << "  -q, --quiet             不输出加载信息\n";
    os << "  -h, --help              显示帮助信息\n\n";
    os << "以 '-' 开头的词 (如 -lrb-) 需要放在 -- 之后。\n";
}

// 整个参数必须是正整数
int ParsePositive(const char* name, const char* value) {
    size_t pos = 0;
    int parsed = std::stoi(value, &pos);
    if (pos != std::strlen(value)) {
        throw std::invalid_argument(std::string(name) + " must be an integer, got '" + value + "'");
    }
    if (parsed <= 0) {
        throw std::invalid_argument(std::string(name) + " must be positive");
    }
    return parsed;
}

} // namespace

int RunCommandLine(int argc, char** argv, std::ostream& out, std::ostream& err) {
    VectorStore::Config store_config;
    AnalogyQuery::Config query_config;
    std::string table_file;

    static struct option long_options[] = {
        {"file",           required_argument, 0, 'f'},
        {"default-table",  no_argument,       0, 'F'},
        {"mode",           required_argument, 0, 'm'},
        {"metric",         required_argument, 0, 'M'},
        {"cosine",         no_argument,       0, kOptCosine},
        {"euclidean",      no_argument,       0, kOptEuclidean},
        {"dim",            required_argument, 0, 'd'},
        {"lenient",        no_argument,       0, 'l'},
        {"top",            required_argument, 0, 'k'},
        {"threads",        required_argument, 0, 'p'},
        {"include-inputs", no_argument,       0, 'i'},
        {"quiet",          no_argument,       0, 'q'},
        {"help",           no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;
    optind = 0;  // 重新初始化 getopt，允许在同一进程内多次调用

    try {
        while ((opt = getopt_long(argc, argv, "f:Fm:M:d:lk:p:iqh",
                                  long_options, &option_index)) != -1) {
            switch (opt) {
                case 'f':
                    table_file = optarg;
                    break;
                case 'F':
                    table_file = kDefaultTable;
                    break;
                case 'm': {
                    auto mode = ParseMode(optarg);
                    if (!mode) {
                        throw std::invalid_argument(std::string("unknown mode '") + optarg + "'");
                    }
                    query_config.mode = *mode;
                    break;
                }
                case 'M': {
                    auto metric = ParseMetric(optarg);
                    if (!metric) {
                        throw std::invalid_argument(std::string("unknown metric '") + optarg + "'");
                    }
                    query_config.metric = *metric;
                    break;
                }
                case kOptCosine:
                    query_config.metric = Metric::kCosine;
                    break;
                case kOptEuclidean:
                    query_config.metric = Metric::kEuclidean;
                    break;
                case 'd':
                    store_config.expected_dim = static_cast<size_t>(ParsePositive("--dim", optarg));
                    break;
                case 'l':
                    store_config.lenient = true;
                    break;
                case 'k':
                    query_config.top_k = static_cast<size_t>(ParsePositive("--top", optarg));
                    break;
                case 'p':
                    query_config.num_threads = ParsePositive("--threads", optarg);
                    break;
                case 'i':
                    query_config.exclude_inputs = false;
                    break;
                case 'q':
                    store_config.verbose = false;
                    break;
                case 'h':
                    PrintUsage(out, argv[0]);
                    return 0;
                default:
                    PrintUsage(err, argv[0]);
                    return 1;
            }
        }
    } catch (const std::exception& e) {
        err << "Error: invalid option value: " << e.what() << "\n";
        PrintUsage(err, argv[0]);
        return 1;
    }

    // 没有 -f/-F 时第一个位置参数是词向量文件
    int first_token = optind;
    if (table_file.empty() && first_token < argc) {
        table_file = argv[first_token++];
    }
    std::vector<std::string> tokens(argv + first_token, argv + argc);

    if (table_file.empty() || tokens.empty()) {
        err << "Error: a vector file and at least one word are required\n";
        PrintUsage(err, argv[0]);
        return 1;
    }

    try {
        const VectorStore store = VectorStore::Load(table_file, store_config);

        AnalogyQuery query(store, query_config);
        QueryResult result = query.Run(tokens);

        if (result.neighbors.empty()) {
            err << "No nearest neighbor found.\n";
            return 0;
        }

        const char* label = MetricLabel(query_config.metric);
        for (const auto& n : result.neighbors) {
            out << n.word << " " << label << ": "
                << std::fixed << std::setprecision(4) << n.score << "\n";
        }

    } catch (const EmptyInput& e) {
        err << e.what() << ".\n";
        return 0;
    } catch (const std::exception& e) {
        err << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

} // namespace vecanalogy
