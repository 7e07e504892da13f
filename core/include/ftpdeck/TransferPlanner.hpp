// Batches and jobs, and the planner that expands a marked selection into them.
#pragma once
#include "Endpoint.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace ftpdeck {

enum class JobKind { Upload, Download, Delete, Mkdir, Rename };
enum class JobState { Pending, Active, Done, Failed, Cancelled };

const char* jobKindName(JobKind k);
const char* jobStateName(JobState s);

struct Location {
    Side        side = Side::Local;
    std::string path;
};

struct TransferJob {
    std::uint64_t id = 0;           // 1-based position in the batch
    std::uint64_t batch_token = 0;
    JobKind       kind = JobKind::Upload;
    Location      source;
    Location      dest;             // the endpoint the job mutates
    bool          directory = false;
    std::uint64_t size_bytes = 0;   // 0 for directory markers and deletes
    JobState      state = JobState::Pending;
    Error         error;

    // Base name shown in progress lines
    std::string displayName() const;
};

struct PlanFailure {
    std::string path;
    Error       error;
};

struct Batch {
    std::uint64_t token = 0;
    Side          origin = Side::Local;   // pane whose selection produced it
    JobKind       kind = JobKind::Upload;
    bool          from_selection = true;  // false for single rename/mkdir/editor batches
    std::vector<TransferJob> jobs;
    std::uint64_t bytes_total = 0;
    std::uint64_t bytes_done = 0;
    std::vector<PlanFailure> plan_failures;
};

// Expansion of marked entries into flat job lists. Directory traversal uses
// explicit worklists so depth is bounded by heap, not stack.
class TransferPlanner {
public:
    // Upload (local -> remote) or download (remote -> local). Each directory
    // gets a Mkdir job before anything inside it (pre-order).
    static Batch planCopy(JobKind kind,
                          Endpoint& src, const std::string& srcDir,
                          const std::vector<DirEntry>& items,
                          Endpoint& dst, const std::string& dstDir,
                          std::uint64_t token);

    // Every descendant before its directory (post-order). A subtree whose
    // listing fails is skipped and recorded once in plan_failures.
    static Batch planDelete(Endpoint& ep, const std::string& dir,
                            const std::vector<DirEntry>& items,
                            std::uint64_t token);

    static Batch planRename(Endpoint& ep, const std::string& from, const std::string& to,
                            std::uint64_t token);

    static Batch planMkdir(Endpoint& ep, const std::string& path, std::uint64_t token);

    // One file between explicit paths (the editor's temp copy and back).
    static Batch planFile(JobKind kind,
                          Endpoint& src, const std::string& from,
                          Endpoint& dst, const std::string& to,
                          std::uint64_t size, std::uint64_t token);
};

} // namespace ftpdeck
