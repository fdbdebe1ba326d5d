#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "skipgram.hpp"

namespace {

using Clock = std::chrono::steady_clock;

Clock::time_point g_last_mark = Clock::now();

void PrintElapsed(const std::string& message) {
    auto now = Clock::now();
    double seconds = std::chrono::duration<double>(now - g_last_mark).count();
    std::cout << "*** " << message << " " << skipgram::StringPrintf("%.2f", seconds) << " sec\n";
    g_last_mark = now;
}

// 交互查询：analogy w0 w1 w2 / nearby w1 w2 ... / EXIT
void RunInteractive(const skipgram::QueryEngine& queries) {
    std::cout << "\nCommands:\n";
    std::cout << "  analogy <w0> <w1> <w2>   w0:w1 :: w2:?  (e.g. france paris russia)\n";
    std::cout << "  nearby <word> [word...]  nearest words by cosine similarity\n";
    std::cout << "  EXIT                     quit\n\n";
    std::cout << "> " << std::flush;

    std::string input;
    while (std::getline(std::cin, input)) {
        if (input == "EXIT") break;

        std::istringstream iss(input);
        std::string command;
        std::vector<std::string> words;
        std::string word;
        iss >> command;
        while (iss >> word) {
            words.push_back(word);
        }

        if (command == "analogy" && words.size() == 3) {
            for (const auto& candidate : queries.Analogy(words[0], words[1], words[2])) {
                std::cout << candidate << "\n";
            }
        } else if (command == "nearby" && !words.empty()) {
            auto results = queries.Nearby(words);
            for (size_t i = 0; i < words.size(); ++i) {
                std::cout << "\n" << words[i] << "\n=====================================\n";
                for (const auto& neighbor : results[i]) {
                    printf("%-20s %6.4f\n", neighbor.first.c_str(), neighbor.second);
                }
            }
        } else if (!command.empty()) {
            std::cout << "Error: expected 'analogy w0 w1 w2' or 'nearby word...'\n";
        }
        std::cout << "\n> " << std::flush;
    }
}

} // namespace

int main(int argc, char** argv) {
    skipgram::Options options;

    try {
        options = skipgram::ParseOptions(argc, argv);
        if (options.help) {
            skipgram::PrintUsage(argv[0]);
            return 0;
        }
        skipgram::ResolveOptions(options);
    } catch (const skipgram::ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        skipgram::PrintUsage(argv[0]);
        return 1;
    }

    try {
        skipgram::Logger::Instance().Open(options.log_file);
        skipgram::LogOptions(options);

        if (!options.dry_run) {
            std::filesystem::create_directories(options.save_path);
        }

        // 学习词汇表
        skipgram::Vocabulary vocab;
        std::vector<std::string> tokens = vocab.LearnFromFile(options.train_data, options.min_count);
        skipgram::Log() << "Data file: " << options.train_data;

        skipgram::ExampleGenerator generator(vocab, vocab.Encode(tokens),
                                             options.GeneratorConfig());
        tokens.clear();
        tokens.shrink_to_fit();

        skipgram::EmbeddingModel model(vocab, options.ModelConfig());

        skipgram::AnalogyEvaluator evaluator(vocab);
        evaluator.Load(options.eval_data);

        if (!options.dry_run) {
            vocab.Save(options.VocabPath());
        }
        PrintElapsed("model created");

        if (options.load_data) {
            model.LoadCheckpoint(options.CheckpointPath());
            PrintElapsed("model restored");
        }

        evaluator.Evaluate(model);

        // 每个 epoch 训练后评估一次
        skipgram::Trainer trainer(generator, model, options.TrainerConfig());
        for (int epoch = 0; epoch < options.epochs_to_train; ++epoch) {
            trainer.TrainEpoch();
            evaluator.Evaluate(model);
            PrintElapsed("model train epoch " + std::to_string(epoch));
        }

        if (options.epochs_to_train > 0 && !options.dry_run) {
            model.SaveCheckpoint(options.CheckpointPath());
            PrintElapsed("model saved");
        }

        if (options.Interactive()) {
            skipgram::QueryEngine queries(vocab, model);
            RunInteractive(queries);
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        skipgram::Logger::Instance().Close();
        return 1;
    }

    skipgram::Logger::Instance().Close();
    return 0;
}
