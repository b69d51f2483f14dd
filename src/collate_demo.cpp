// src/collate_demo.cpp
#include "cmg/collation/history_collator.hpp"
#include "cmg/config/config_io.hpp"
#include "cmg/data/example_io.hpp"
#include "cmg/data/serialization.hpp"
#include "cmg/training/batch_loader.hpp"
#include <iostream>
#include <string>
#include <utility>

using namespace cmg;

int main(int argc, char** argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <examples.jsonl> [batch_size] [batch_out.bin]" << std::endl;
        return 1;
    }

    std::cout << "=== Commit Message Collation Demo ===\n\n";

    try {
        CollatorConfig config = load_collator_config(argv[1]);
        config.print();

        auto examples = load_examples_jsonl(argv[2]);
        std::cout << "Loaded " << examples.size() << " examples\n";

        size_t batch_size = argc > 3 ? std::stoul(argv[3]) : 8;
        HistoryCollator collator(config);
        BatchLoader loader(std::move(examples), collator, batch_size);

        size_t index = 0;
        while (loader.has_next()) {
            Batch batch = loader.next_batch();
            std::cout << "Batch " << index << ": msg_ids [" << batch.msg_ids.rows() << ", "
                      << batch.msg_ids.cols() << "], generation_ids [" << batch.generation_ids.rows()
                      << ", " << batch.generation_ids.cols() << "], diff_ids ["
                      << batch.diff_ids.rows() << ", " << batch.diff_ids.cols() << "]\n";

            if (index == 0 && argc > 4) {
                save_batch(argv[4], batch);
                std::cout << "First batch saved to " << argv[4] << "\n";
            }
            index++;
        }

        std::cout << "\n=== Demo completed successfully! ===\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
