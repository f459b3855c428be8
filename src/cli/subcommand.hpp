#ifndef NANOCOLLAPSE_CLI_SUBCOMMAND_HPP
#define NANOCOLLAPSE_CLI_SUBCOMMAND_HPP

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace nanocollapse {
namespace cli {

// Subcommand handler: argv[0] is the subcommand name.
using SubcommandFn = std::function<int(int argc, char* argv[])>;

// Registry of available subcommands
class SubcommandRegistry {
public:
    struct CommandEntry {
        std::string name;
        std::string description;
        int order;
    };

    static SubcommandRegistry& instance();

    void register_command(const std::string& name,
                          const std::string& description,
                          SubcommandFn fn,
                          int order = 99);

    bool has_command(const std::string& name) const;
    int run_command(const std::string& name, int argc, char* argv[]) const;

    void print_help(const char* program_name) const;

private:
    SubcommandRegistry() = default;
    std::unordered_map<std::string, SubcommandFn> handlers_;
    std::vector<CommandEntry> command_list_;
};

// Registers a subcommand from a static object in its translation unit.
struct CommandRegistrar {
    CommandRegistrar(const char* name, const char* description, SubcommandFn fn, int order) {
        SubcommandRegistry::instance().register_command(name, description, std::move(fn), order);
    }
};

// Subcommand entry points
int cmd_collapse(int argc, char* argv[]);

}  // namespace cli
}  // namespace nanocollapse

#endif  // NANOCOLLAPSE_CLI_SUBCOMMAND_HPP
