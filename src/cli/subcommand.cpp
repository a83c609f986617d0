#include "subcommand.hpp"
#include "degen/version.h"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace degen {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    if (find(name)) {
        throw std::logic_error("Subcommand registered twice: " + name);
    }
    entries_.push_back({name, description, std::move(fn), order});
    std::stable_sort(entries_.begin(), entries_.end(),
                     [](const CommandEntry& a, const CommandEntry& b) { return a.order < b.order; });
}

const SubcommandRegistry::CommandEntry* SubcommandRegistry::find(const std::string& name) const {
    for (const auto& e : entries_) {
        if (e.name == name) return &e;
    }
    return nullptr;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const CommandEntry* entry = find(name);
    if (!entry) {
        std::cerr << "Unknown command: " << name << "\n";
        std::cerr << "Run 'degen --help' for usage information.\n";
        return 1;
    }
    return entry->fn(argc, argv);
}

void SubcommandRegistry::print_help(const char* program_name) const {
    std::cout << "degen v" << DEGEN_VERSION << " - degenerate codon library design\n\n";
    std::cout << "Usage: " << program_name << " <command> [options]\n\n";
    std::cout << "Commands:\n";

    size_t width = 0;
    for (const auto& e : entries_) width = std::max(width, e.name.size());

    for (const auto& e : entries_) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width + 2)) << e.name
                  << e.description << "\n";
    }

    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace degen
