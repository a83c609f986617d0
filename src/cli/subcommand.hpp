#ifndef DEGEN_CLI_SUBCOMMAND_HPP
#define DEGEN_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <vector>

namespace degen {
namespace cli {

using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Registry of subcommands; each cmd_*.cpp adds itself from a static registrar
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        SubcommandFn fn;
        int order;
    };

    static SubcommandRegistry& instance();

    // Throws std::logic_error on a duplicate name
    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    const CommandEntry* find(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    // Commands listed in workflow order
    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::vector<CommandEntry> entries_;
};

int cmd_analyze(int argc, char* argv[]);
int cmd_library(int argc, char* argv[]);
int cmd_design(int argc, char* argv[]);
int cmd_catalog(int argc, char* argv[]);
int cmd_iupac(int argc, char* argv[]);

}  // namespace cli
}  // namespace degen

#endif  // DEGEN_CLI_SUBCOMMAND_HPP
