// File: src/cli/kte_cli.hpp
//
// Command-line driver of the knowledge-tracing engine
// Extracted from main for testability

#ifndef KTE_CLI_HPP
#define KTE_CLI_HPP

#include "config/engine_config.hpp"
#include "engine/tracing_engine.hpp"
#include "storage/memory_store.hpp"
#include "storage/sqlite_store.hpp"
#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace kte {

/// Interactive driver: one command per line, results printed to `out`
///
/// Owns the stores selected by `storage.backend` and the engine on top of them.
/// Errors raised by a command are printed and counted; they never end the session.
class KteCli {
public:
    /// @throws ConfigurationError if the configuration is invalid
    /// @throws EngineError if the SQLite database cannot be opened
    KteCli(const EngineConfig& config, std::ostream& out);
    ~KteCli();

    KteCli(const KteCli&) = delete;
    KteCli& operator=(const KteCli&) = delete;

    /// Main run loop; reads commands until /quit or end of input
    void Run(std::istream& in);

    /// Process a single command line
    void ProcessCommand(const std::string& input);

    bool IsRunning() const { return running_; }
    bool IsVerboseEnabled() const { return verbose_; }
    size_t GetCommandCount() const { return commands_; }
    size_t GetErrorCount() const { return errors_; }

    TracingEngine& GetEngine() { return *engine_; }
    ParameterStore& GetParameterStore() { return *parameter_store_; }

private:
    EngineConfig config_;
    std::ostream& out_;

    // Exactly one backend is set
    std::unique_ptr<MemoryStore> memory_;
    std::unique_ptr<SqliteStore> sqlite_;

    ParameterStore* parameter_store_{nullptr};
    KnowledgeStateStore* state_store_{nullptr};
    EventLog* event_log_{nullptr};
    SnapshotStore* snapshot_store_{nullptr};

    std::unique_ptr<TracingEngine> engine_;

    bool running_ = true;
    bool verbose_ = false;
    std::string prompt_ = "kte> ";
    size_t commands_ = 0;
    size_t errors_ = 0;

    // Command handling
    void HandleCommand(const std::string& command, const std::vector<std::string>& args);

    // Commands
    void ShowHelp();
    void Answer(const std::vector<std::string>& args);
    void AllocateTime(const std::vector<std::string>& args);
    void ShowMastery(const std::vector<std::string>& args);
    void SetParameters(const std::vector<std::string>& args);
    void RecordSample(const std::vector<std::string>& args);
    void ShowFairness(const std::vector<std::string>& args);
    void Fit(const std::vector<std::string>& args);
    void FitFromLog(const std::vector<std::string>& args);
    void Calibrate(const std::vector<std::string>& args);
    void ShowStatistics();
    void Save();
    void Load();
    void ShowConfig();

    // Utilities
    static void RequireArgs(const std::vector<std::string>& args, size_t count,
                            const char* usage);
    static std::string ArgOr(const std::vector<std::string>& args, size_t index,
                             const std::string& fallback);
    void PrintCalibration(const CalibrationEntry& entry);
};

/// Parse a whole token as a number
/// @throws ValidationError naming `what` when the token is not a number
double ParseNumber(const std::string& token, const char* what);

/// Accepts 1/0, true/false, correct/incorrect, y/n
/// @throws ValidationError for anything else
bool ParseOutcome(const std::string& token);

/// Split "a,b,c" into its non-empty parts
std::vector<std::string> SplitList(const std::string& text);

} // namespace kte

#endif // KTE_CLI_HPP
