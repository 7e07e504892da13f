// Interactive state machine behind the dual-pane UI: panes, selection, modals,
// key dispatch, and the hand-off of batches to the transfer queue.
#pragma once
#include "Connector.hpp"
#include "Endpoint.hpp"
#include "TransferQueue.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ftpdeck {

// Front-end independent key codes. Printable keys are their ASCII value.
namespace key {
constexpr int Tab = '\t';
constexpr int Enter = '\n';
constexpr int Escape = 27;
constexpr int Backspace = 127;
constexpr int Up = 0x1001;
constexpr int Down = 0x1002;
constexpr int Left = 0x1003;
constexpr int Right = 0x1004;
constexpr int PageUp = 0x1005;
constexpr int PageDown = 0x1006;
constexpr int Home = 0x1007;
constexpr int End = 0x1008;
} // namespace key

enum class ControllerState { Browsing, Modal, TransferringBatch, Quit };

enum class ModalKind { None, ConfirmDelete, ConfirmOverwrite, TextInput, Viewer, Editor };

enum class InputPurpose { Rename, Mkdir, Address, Search };

enum class MessageKind { Info, Success, Error };

const char* controllerStateName(ControllerState s);

struct StatusMessage {
    MessageKind kind = MessageKind::Info;
    std::string text;
};

struct Pane {
    Side side = Side::Local;
    std::vector<DirEntry> entries;  // sorted, ".." first below the root
    std::size_t cursor = 0;
    std::size_t scroll = 0;
    std::vector<std::string> selection;  // distinct names, in marking order

    bool isMarked(const std::string& name) const;
    const DirEntry* current() const;
};

struct ModalView {
    ModalKind kind = ModalKind::None;
    InputPurpose purpose = InputPurpose::Search;
    std::string title;
    std::string input;   // TextInput buffer
    std::string error;   // validation message shown inside the modal
    std::vector<std::string> lines;  // viewer body
    std::size_t scroll = 0;
};

// Runs an external editor on a file and returns once it exits.
class EditorLauncher {
public:
    virtual ~EditorLauncher() = default;
    virtual bool edit(const std::string& path, Error& err) = 0;
};

struct ControllerOptions {
    std::size_t viewer_limit = 1024 * 1024;
    std::size_t page_step = 10;
    bool show_hidden = false;
    std::string temp_dir;  // editor copies; empty means the system temp dir
};

class SessionController {
public:
    SessionController(Connector& connector, Endpoint& local, Endpoint& remote, TransferQueue& queue,
                      ControllerOptions opt = ControllerOptions());
    ~SessionController();

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Lists the local pane and connects: to url when given, else ensureConnected().
    void start(const std::optional<Address>& url);

    void handleKey(int k);

    // Drains progress snapshots and finished batches. Called once per redraw.
    void tick();

    // Editor modal: the front end releases the terminal and calls this.
    bool editPending() const { return modal_.kind == ModalKind::Editor; }
    void runPendingEdit();
    void setEditorLauncher(EditorLauncher* launcher) { editor_ = launcher; }

    // Rows available to each pane's listing; scroll offsets follow it.
    void setViewRows(std::size_t rows);

    ControllerState state() const;
    bool transferring() const { return batch_.has_value(); }
    JobKind batchKind() const { return batch_ ? batch_->kind : JobKind::Upload; }
    bool connected() const { return connected_; }
    Side activeSide() const { return active_; }
    const Pane& pane(Side s) const { return s == Side::Local ? localPane_ : remotePane_; }
    const ModalView& modal() const { return modal_; }
    const StatusMessage& message() const { return message_; }
    const std::optional<ProgressSnapshot>& progress() const { return progress_; }
    const Address& address() const { return connector_.address(); }
    std::string cwd(Side s) const { return endpoint(s).cwd(); }

    // Address offered by the address prompt and used by the connect key.
    Address targetAddress();

private:
    // What the controller remembers about the batch it handed to the queue.
    struct PendingBatch {
        std::uint64_t token = 0;
        JobKind kind = JobKind::Upload;
        Side origin = Side::Local;
        bool from_selection = true;
        bool edit = false;         // leg of an editor round trip
        bool edit_upload = false;
    };

    struct EditSession {
        std::string temp_path;
        std::string remote_path;
        std::string name;
        long long mtime_ns = 0;
        std::uintmax_t size = 0;
    };

    Endpoint& endpoint(Side s) const { return s == Side::Local ? local_ : remote_; }
    Pane& paneFor(Side s) { return s == Side::Local ? localPane_ : remotePane_; }
    Pane& activePane() { return paneFor(active_); }

    void setMessage(MessageKind kind, std::string text);
    bool remoteUsable(bool quiet = false);

    // browsing
    void handleBrowsingKey(int k);
    void moveCursor(long delta);
    void cursorTo(std::size_t index);
    void keepVisible(Pane& p);
    void openEntry();
    void goParent();
    void changeDir(Side s, const std::string& dir, const std::string& focus);
    void switchPane();
    void toggleMark();
    bool listDir(Side s, const std::string& dir, std::vector<DirEntry>& out, Error& err);
    bool refresh(Side s);
    std::vector<DirEntry> markedOrCurrent(Side s) const;

    // connection
    void toggleConnection();
    bool connectTo(const std::optional<Address>& addr);
    void afterConnect();
    void disconnect(const std::string& why);
    void connectionLost(const Error& err);

    // actions
    void requestCopy(JobKind kind);
    void startCopy(JobKind kind, const std::vector<DirEntry>& items);
    void requestDelete();
    void startDelete(const std::vector<DirEntry>& items);
    void openInput(InputPurpose purpose, const std::string& title, const std::string& prefill);
    void submitInput();
    bool validateName(const std::string& name, std::string& why) const;
    void runSearch(const std::string& query);
    void openViewer();
    void beginEdit();
    void finishEdit(const BatchResult& r, const PendingBatch& pending);
    void dropEditCopy();
    bool enqueue(Batch batch, PendingBatch pending);
    bool planUsable(const Batch& batch);
    void finishBatch(BatchResult r);
    void requestQuit();
    void cancelBatch();
    bool refuseWhileBusy();

    // modals
    void handleModalKey(int k);
    void closeModal();

    Connector& connector_;
    Endpoint& local_;
    Endpoint& remote_;
    TransferQueue& queue_;
    ControllerOptions opt_;
    EditorLauncher* editor_ = nullptr;

    Pane localPane_;
    Pane remotePane_;
    Side active_ = Side::Local;
    ModalView modal_;
    StatusMessage message_;
    std::size_t viewRows_ = 20;

    // Cached so nothing asks the session while the worker owns it
    bool connected_ = false;
    std::optional<Address> target_;

    std::optional<PendingBatch> batch_;
    std::optional<ProgressSnapshot> progress_;
    std::uint64_t nextToken_ = 1;
    bool quitting_ = false;
    bool quit_ = false;

    // Work waiting behind a confirmation modal
    std::vector<DirEntry> pendingItems_;
    JobKind pendingKind_ = JobKind::Upload;
    std::string renameFrom_;
    std::optional<EditSession> edit_;
};

} // namespace ftpdeck
