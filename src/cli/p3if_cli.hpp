// File: src/cli/p3if_cli.hpp
//
// P3IF CLI class definition
// Extracted for testability

#ifndef P3IF_CLI_HPP
#define P3IF_CLI_HPP

#include "config/framework_config.hpp"
#include "framework/framework.hpp"
#include "framework/worker_pool.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace p3if {

/// ANSI color codes for terminal output
namespace Color {
    inline const char* RESET = "\033[0m";

    inline const char* RED = "\033[31m";
    inline const char* GREEN = "\033[32m";
    inline const char* YELLOW = "\033[33m";
    inline const char* CYAN = "\033[36m";

    inline const char* BOLD_RED = "\033[1;31m";
    inline const char* BOLD_GREEN = "\033[1;32m";
    inline const char* BOLD_CYAN = "\033[1;36m";

    inline const char* BOLD = "\033[1m";
    inline const char* DIM = "\033[2m";
}

/// Interactive shell over a Framework
/// Lines starting with '/' are commands; any other line is a pattern search
class P3ifCli {
public:
    explicit P3ifCli(const FrameworkConfig& config = FrameworkConfig::Default(),
                     std::ostream& out = std::cout);
    ~P3ifCli();

    /// Main run loop - interactive mode
    void Run(std::istream& in = std::cin);

    /// Process a single command (for testing and one-shot mode)
    void ProcessCommand(const std::string& input);

    Framework& GetFramework() { return *framework_; }
    const FrameworkConfig& GetConfig() const { return config_; }

    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const { return verbose_; }
    size_t GetCommandsProcessed() const { return commands_processed_; }

    /// Number of commands that ended in an error message
    size_t GetErrorCount() const { return errors_; }

private:
    FrameworkConfig config_;
    std::ostream& out_;
    std::unique_ptr<Framework> framework_;
    std::unique_ptr<WorkerPool> pool_;

    bool running_ = true;
    bool verbose_ = false;
    bool colors_enabled_ = true;
    size_t commands_processed_ = 0;
    size_t errors_ = 0;

    void PrintWelcome();
    void HandleCommand(const std::string& cmd);

    // Commands
    void ShowHelp();
    void ShowStatistics();
    void ShowValidation();
    void ShowPatterns(const std::string& type_filter);
    void ShowRelationships();
    void Search(const std::string& query);
    void AddPattern(std::istringstream& args);
    void Link(std::istringstream& args);
    void RemovePattern(const std::string& id);
    void Unlink(const std::string& id);
    void Swap(const std::string& old_id, const std::string& new_id);
    void Merge(const std::vector<std::string>& files);
    void Export(const std::string& path);
    void Import(const std::string& path);
    void ExportSqlite(const std::string& db_path);
    void SetPolicy(const std::string& policy);
    void Reset();

    void PrintPattern(const Pattern& pattern);
    void Error(const std::string& message);

    // Color helpers
    const char* C(const char* color) const { return colors_enabled_ ? color : ""; }
};

} // namespace p3if

#endif // P3IF_CLI_HPP
