#include "options.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <getopt.h>
#include <iostream>
#include <stdexcept>

namespace skipgram {

namespace {

enum OptionId {
    kEmbeddingSize = 1000,
    kEpochsToTrain,
    kLearningRate,
    kNumNegSamples,
    kBatchSize,
    kConcurrentSteps,
    kWindowSize,
    kMinCount,
    kSubsample,
    kSavePath,
    kTrainData,
    kEvalData,
    kLogFile,
    kLoadData,
    kResume,
    kDryRun,
    kInteractive,
    kSeed,
    kSerializeUpdates,
    kFixedWindow,
};

int ParseInt(const char* name, const char* value) {
    try {
        size_t pos = 0;
        int result = std::stoi(value, &pos);
        if (value[pos] != '\0') throw std::invalid_argument(value);
        return result;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid integer for --") + name + ": " + value);
    }
}

float ParseFloat(const char* name, const char* value) {
    try {
        size_t pos = 0;
        float result = std::stof(value, &pos);
        if (value[pos] != '\0') throw std::invalid_argument(value);
        return result;
    } catch (const std::exception&) {
        throw ConfigError(std::string("Invalid number for --") + name + ": " + value);
    }
}

bool IsBoolLiteral(const char* value) {
    std::string v(value);
    return v == "1" || v == "true" || v == "0" || v == "false";
}

// --flag、--flag=0/1/true/false 或 --flag 0/1/true/false
bool ParseBool(const char* name, const char* value) {
    if (value == nullptr) return true;
    std::string v(value);
    if (v == "1" || v == "true") return true;
    if (v == "0" || v == "false") return false;
    throw ConfigError(std::string("Invalid boolean for --") + name + ": " + v);
}

} // namespace

ExampleGenerator::Config Options::GeneratorConfig() const {
    ExampleGenerator::Config config;
    config.batch_size = batch_size;
    config.window_size = window_size;
    config.subsample = subsample;
    config.dynamic_window = !fixed_window;
    config.seed = seed;
    return config;
}

EmbeddingModel::Config Options::ModelConfig() const {
    EmbeddingModel::Config config;
    config.embedding_size = embedding_size;
    config.num_neg_samples = num_neg_samples;
    config.serialize_updates = serialize_updates;
    config.seed = seed;
    return config;
}

Trainer::Config Options::TrainerConfig() const {
    Trainer::Config config;
    config.concurrent_steps = concurrent_steps;
    config.epochs_to_train = epochs_to_train;
    config.learning_rate = learning_rate;
    config.seed = seed;
    return config;
}

void PrintUsage(const char* prog_name) {
    std::cout << "skipgram - Skip-gram negative sampling word embeddings\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << prog_name << " --train_data=<file> --eval_data=<file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --train_data=<file>        训练语料 (必需)\n";
    std::cout << "  --eval_data=<file>         类比问题文件，可用 name-%d.txt 读取多个 (必需)\n";
    std::cout << "  --save_path=<dir>          词汇表和模型目录 (默认: savedata)\n";
    std::cout << "  --embedding_size=<int>     向量维度 (默认: 200)\n";
    std::cout << "  --epochs_to_train=<int>    训练 epoch 数 (默认: 15)\n";
    std::cout << "  --learning_rate=<float>    初始学习率 (默认: 0.025)\n";
    std::cout << "  --num_neg_samples=<int>    负采样数量 (默认: 25)\n";
    std::cout << "  --batch_size=<int>         每批样本数 (默认: 500)\n";
    std::cout << "  --concurrent_steps=<int>   训练线程数 (默认: 12)\n";
    std::cout << "  --window_size=<int>        窗口大小 (默认: 5)\n";
    std::cout << "  --min_count=<int>          最小词频 (默认: 5)\n";
    std::cout << "  --subsample=<float>        下采样阈值 (默认: 1e-3, 0=关闭)\n";
    std::cout << "  --load_data[=0|1]          从 save_path 加载模型 (不训练，默认进入交互)\n";
    std::cout << "  --resume[=0|1]             加载后继续训练\n";
    std::cout << "  --dry_run[=0|1]            不保存任何文件\n";
    std::cout << "  --interactive[=0|1]        训练后进入交互查询\n";
    std::cout << "  --seed=<int>               随机种子\n";
    std::cout << "  --serialize_updates[=0|1]  串行化模型更新\n";
    std::cout << "  --fixed_window[=0|1]       使用固定窗口\n";
    std::cout << "  --log_file=<file>          日志文件 (默认: train_log.txt, 空=关闭)\n";
    std::cout << "  -h, --help                 显示帮助信息\n";
}

Options ParseOptions(int argc, char** argv) {
    Options options;

    static struct option long_options[] = {
        {"embedding_size",    required_argument, 0, kEmbeddingSize},
        {"epochs_to_train",   required_argument, 0, kEpochsToTrain},
        {"learning_rate",     required_argument, 0, kLearningRate},
        {"num_neg_samples",   required_argument, 0, kNumNegSamples},
        {"batch_size",        required_argument, 0, kBatchSize},
        {"concurrent_steps",  required_argument, 0, kConcurrentSteps},
        {"window_size",       required_argument, 0, kWindowSize},
        {"min_count",         required_argument, 0, kMinCount},
        {"subsample",         required_argument, 0, kSubsample},
        {"save_path",         required_argument, 0, kSavePath},
        {"train_data",        required_argument, 0, kTrainData},
        {"eval_data",         required_argument, 0, kEvalData},
        {"log_file",          required_argument, 0, kLogFile},
        {"load_data",         optional_argument, 0, kLoadData},
        {"resume",            optional_argument, 0, kResume},
        {"dry_run",           optional_argument, 0, kDryRun},
        {"interactive",       optional_argument, 0, kInteractive},
        {"seed",              required_argument, 0, kSeed},
        {"serialize_updates", optional_argument, 0, kSerializeUpdates},
        {"fixed_window",      optional_argument, 0, kFixedWindow},
        {"help",              no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    // glibc: optind = 0 重新初始化，允许多次调用
    // "+" 关闭参数重排，布尔选项才能安全地取走下一个参数
    optind = 0;
    opterr = 0;

    int opt;
    int option_index = -1;
    while ((opt = getopt_long(argc, argv, "+h", long_options, &option_index)) != -1) {
        const char* name = option_index >= 0 ? long_options[option_index].name : "";
        if (option_index >= 0 && long_options[option_index].has_arg == optional_argument &&
            optarg == nullptr && optind < argc && IsBoolLiteral(argv[optind])) {
            optarg = argv[optind++];
        }
        switch (opt) {
            case kEmbeddingSize:
                options.embedding_size = ParseInt(name, optarg);
                break;
            case kEpochsToTrain:
                options.epochs_to_train = ParseInt(name, optarg);
                break;
            case kLearningRate:
                options.learning_rate = ParseFloat(name, optarg);
                break;
            case kNumNegSamples:
                options.num_neg_samples = ParseInt(name, optarg);
                break;
            case kBatchSize:
                options.batch_size = ParseInt(name, optarg);
                break;
            case kConcurrentSteps:
                options.concurrent_steps = ParseInt(name, optarg);
                break;
            case kWindowSize:
                options.window_size = ParseInt(name, optarg);
                break;
            case kMinCount:
                options.min_count = ParseInt(name, optarg);
                break;
            case kSubsample:
                options.subsample = ParseFloat(name, optarg);
                break;
            case kSavePath:
                options.save_path = optarg;
                break;
            case kTrainData:
                options.train_data = optarg;
                break;
            case kEvalData:
                options.eval_data = optarg;
                break;
            case kLogFile:
                options.log_file = optarg;
                break;
            case kLoadData:
                options.load_data = ParseBool(name, optarg);
                break;
            case kResume:
                options.resume = ParseBool(name, optarg);
                break;
            case kDryRun:
                options.dry_run = ParseBool(name, optarg);
                break;
            case kInteractive:
                options.interactive = ParseBool(name, optarg) ? 1 : 0;
                break;
            case kSeed:
                options.seed = static_cast<uint64_t>(ParseInt(name, optarg));
                break;
            case kSerializeUpdates:
                options.serialize_updates = ParseBool(name, optarg);
                break;
            case kFixedWindow:
                options.fixed_window = ParseBool(name, optarg);
                break;
            case 'h':
                options.help = true;
                break;
            default:
                throw ConfigError(std::string("Unknown or malformed option: ") +
                                  (optind > 0 && optind <= argc ? argv[optind - 1] : "?"));
        }
        option_index = -1;
    }

    if (optind < argc) {
        throw ConfigError(std::string("Unexpected argument: ") + argv[optind]);
    }
    return options;
}

void ResolveOptions(Options& options) {
    if (options.train_data.empty() || options.eval_data.empty()) {
        throw ConfigError("--train_data --eval_data must be specified.");
    }
    if (options.embedding_size <= 0) throw ConfigError("--embedding_size must be positive");
    if (options.epochs_to_train < 0) throw ConfigError("--epochs_to_train must not be negative");
    if (options.learning_rate <= 0) throw ConfigError("--learning_rate must be positive");
    if (options.num_neg_samples < 0) throw ConfigError("--num_neg_samples must not be negative");
    if (options.batch_size <= 0) throw ConfigError("--batch_size must be positive");
    if (options.concurrent_steps <= 0) throw ConfigError("--concurrent_steps must be positive");
    if (options.window_size <= 0) throw ConfigError("--window_size must be positive");
    if (options.min_count <= 0) throw ConfigError("--min_count must be positive");
    if (options.subsample < 0) throw ConfigError("--subsample must not be negative");
    if (options.save_path.empty()) throw ConfigError("--save_path must not be empty");

    // load_data 且不 resume：关闭训练，交互默认开启
    if (options.load_data && !options.resume) {
        options.epochs_to_train = 0;
        if (options.interactive < 0) options.interactive = 1;
    }
    // resume 隐含 load_data
    if (options.resume) {
        options.load_data = true;
    }
    if (options.interactive < 0) options.interactive = 0;
}

void LogOptions(const Options& options) {
    Log() << "====================";
    Log() << "embedding_size:   " << options.embedding_size;
    Log() << "epochs_to_train:  " << options.epochs_to_train;
    Log() << "learning_rate:    " << options.learning_rate;
    Log() << "num_neg_samples:  " << options.num_neg_samples;
    Log() << "batch_size:       " << options.batch_size;
    Log() << "window_size:      " << options.window_size;
    Log() << "subsample:        " << options.subsample;
    Log() << "====================";
}

} // namespace skipgram
