// Key dispatch and batch bookkeeping for the two panes.
#include "ftpdeck/SessionController.hpp"
#include "ftpdeck/Log.hpp"
#include "ftpdeck/TransferPlanner.hpp"
#include "ftpdeck/Url.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <unistd.h>

namespace fs = std::filesystem;

namespace ftpdeck {

const char* controllerStateName(ControllerState s) {
    switch (s) {
        case ControllerState::Browsing:          return "browsing";
        case ControllerState::Modal:             return "modal";
        case ControllerState::TransferringBatch: return "transferring";
        case ControllerState::Quit:              return "quit";
    }
    return "?";
}

bool Pane::isMarked(const std::string& name) const {
    return std::find(selection.begin(), selection.end(), name) != selection.end();
}

const DirEntry* Pane::current() const {
    return cursor < entries.size() ? &entries[cursor] : nullptr;
}

static std::string lowered(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

static std::string baseName(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    std::size_t slash = p.rfind('/');
    return slash == std::string::npos ? p : p.substr(slash + 1);
}

static bool fileStamp(const std::string& path, long long& mtime, std::uintmax_t& size) {
    std::error_code ec;
    auto t = fs::last_write_time(path, ec);
    if (ec) return false;
    size = fs::file_size(path, ec);
    if (ec) return false;
    mtime = static_cast<long long>(t.time_since_epoch().count());
    return true;
}

SessionController::SessionController(Connector& connector, Endpoint& local, Endpoint& remote,
                                     TransferQueue& queue, ControllerOptions opt)
    : connector_(connector), local_(local), remote_(remote), queue_(queue), opt_(std::move(opt)) {
    localPane_.side = Side::Local;
    remotePane_.side = Side::Remote;
}

SessionController::~SessionController() {
    dropEditCopy();
}

ControllerState SessionController::state() const {
    if (quit_) return ControllerState::Quit;
    if (modal_.kind != ModalKind::None) return ControllerState::Modal;
    if (batch_) return ControllerState::TransferringBatch;
    return ControllerState::Browsing;
}

void SessionController::setMessage(MessageKind kind, std::string text) {
    message_.kind = kind;
    message_.text = std::move(text);
}

Address SessionController::targetAddress() {
    return target_ ? *target_ : connector_.preferredAddress();
}

void SessionController::start(const std::optional<Address>& url) {
    refresh(Side::Local);
    if (url) target_ = *url;
    connectTo(url);
}

void SessionController::setViewRows(std::size_t rows) {
    viewRows_ = rows ? rows : 1;
    keepVisible(localPane_);
    keepVisible(remotePane_);
}

// ---- listing and navigation ----

bool SessionController::listDir(Side s, const std::string& dir, std::vector<DirEntry>& out, Error& err) {
    Endpoint& ep = endpoint(s);
    std::vector<DirEntry> listed;
    if (!ep.list(dir, listed, err)) return false;
    if (!opt_.show_hidden) {
        listed.erase(std::remove_if(listed.begin(), listed.end(),
                                    [](const DirEntry& e) { return !e.name.empty() && e.name[0] == '.'; }),
                     listed.end());
    }
    sortEntries(listed);
    if (ep.parentOf(dir) != dir) {
        DirEntry up;
        up.name = "..";
        up.kind = EntryKind::Directory;
        listed.insert(listed.begin(), up);
    }
    out = std::move(listed);
    return true;
}

bool SessionController::refresh(Side s) {
    Pane& p = paneFor(s);
    if (s == Side::Remote && !connected_) {
        p = Pane();
        p.side = Side::Remote;
        return false;
    }
    Endpoint& ep = endpoint(s);
    std::vector<DirEntry> listed;
    Error err;
    if (!listDir(s, ep.cwd(), listed, err)) {
        if (s == Side::Remote && isConnectionFatal(err.code)) {
            connectionLost(err);
            return false;
        }
        setMessage(MessageKind::Error, "Cannot list " + ep.cwd() + ": " + err.describe());
        return false;
    }
    p.entries = std::move(listed);
    // Marks on entries that vanished go with them
    p.selection.erase(std::remove_if(p.selection.begin(), p.selection.end(),
                                     [&](const std::string& name) {
                                         return std::none_of(p.entries.begin(), p.entries.end(),
                                                             [&](const DirEntry& e) { return e.name == name; });
                                     }),
                      p.selection.end());
    if (p.cursor >= p.entries.size()) p.cursor = p.entries.empty() ? 0 : p.entries.size() - 1;
    keepVisible(p);
    return true;
}

void SessionController::keepVisible(Pane& p) {
    if (p.cursor < p.scroll) p.scroll = p.cursor;
    else if (p.cursor >= p.scroll + viewRows_) p.scroll = p.cursor - viewRows_ + 1;
}

void SessionController::moveCursor(long delta) {
    Pane& p = activePane();
    if (p.entries.empty()) return;
    long last = static_cast<long>(p.entries.size()) - 1;
    long c = std::clamp(static_cast<long>(p.cursor) + delta, 0L, last);
    p.cursor = static_cast<std::size_t>(c);
    keepVisible(p);
}

void SessionController::cursorTo(std::size_t index) {
    Pane& p = activePane();
    p.cursor = p.entries.empty() ? 0 : std::min(index, p.entries.size() - 1);
    keepVisible(p);
}

bool SessionController::remoteUsable(bool quiet) {
    if (batch_) {
        if (!quiet) setMessage(MessageKind::Info, "Remote is busy while a transfer runs (x to cancel)");
        return false;
    }
    if (!connected_) {
        if (!quiet) setMessage(MessageKind::Error, "Not connected (c to connect)");
        return false;
    }
    return true;
}

bool SessionController::refuseWhileBusy() {
    if (!batch_) return false;
    setMessage(MessageKind::Info, "Transfer in progress (x to cancel)");
    return true;
}

void SessionController::changeDir(Side s, const std::string& dir, const std::string& focus) {
    std::vector<DirEntry> listed;
    Error err;
    if (!listDir(s, dir, listed, err)) {
        if (s == Side::Remote && isConnectionFatal(err.code)) connectionLost(err);
        else setMessage(MessageKind::Error, "Cannot open " + dir + ": " + err.describe());
        return;
    }
    endpoint(s).setCwd(dir);
    Pane& p = paneFor(s);
    p.entries = std::move(listed);
    p.selection.clear();
    p.cursor = 0;
    p.scroll = 0;
    if (!focus.empty()) {
        for (std::size_t i = 0; i < p.entries.size(); ++i) {
            if (p.entries[i].name == focus) {
                p.cursor = i;
                break;
            }
        }
    }
    keepVisible(p);
}

void SessionController::openEntry() {
    const DirEntry* e = activePane().current();
    if (!e || !e->isDir()) return;
    if (e->name == "..") {
        goParent();
        return;
    }
    if (active_ == Side::Remote && !remoteUsable()) return;
    Endpoint& ep = endpoint(active_);
    changeDir(active_, ep.join(ep.cwd(), e->name), std::string());
}

void SessionController::goParent() {
    if (active_ == Side::Remote && !remoteUsable()) return;
    Endpoint& ep = endpoint(active_);
    const std::string cur = ep.cwd();
    const std::string parent = ep.parentOf(cur);
    if (parent == cur) return;
    changeDir(active_, parent, baseName(cur));
}

void SessionController::switchPane() {
    if (batch_) {
        setMessage(MessageKind::Info, "Pane switch is disabled while a transfer runs");
        return;
    }
    active_ = active_ == Side::Local ? Side::Remote : Side::Local;
    if (active_ == Side::Remote && connected_) refresh(Side::Remote);
    else if (active_ == Side::Local) refresh(Side::Local);
}

void SessionController::toggleMark() {
    Pane& p = activePane();
    const DirEntry* e = p.current();
    if (!e || e->name == "..") return;
    auto it = std::find(p.selection.begin(), p.selection.end(), e->name);
    if (it != p.selection.end()) p.selection.erase(it);
    else p.selection.push_back(e->name);
    moveCursor(1);
}

std::vector<DirEntry> SessionController::markedOrCurrent(Side s) const {
    const Pane& p = pane(s);
    std::vector<DirEntry> out;
    if (!p.selection.empty()) {
        for (const std::string& name : p.selection) {
            auto it = std::find_if(p.entries.begin(), p.entries.end(),
                                   [&](const DirEntry& e) { return e.name == name; });
            if (it != p.entries.end()) out.push_back(*it);
        }
        return out;
    }
    const DirEntry* e = p.current();
    if (e && e->name != "..") out.push_back(*e);
    return out;
}

// ---- keys ----

void SessionController::handleKey(int k) {
    if (quit_) return;
    if (modal_.kind != ModalKind::None) {
        handleModalKey(k);
        return;
    }
    handleBrowsingKey(k);
}

void SessionController::handleBrowsingKey(int k) {
    switch (k) {
        case 'q':
        case 'Q':
            requestQuit();
            return;
        case 'x':
            cancelBatch();
            return;
        case key::Up:
        case 'k':
            moveCursor(-1);
            return;
        case key::Down:
        case 'j':
            moveCursor(1);
            return;
        case key::PageUp:
            moveCursor(-static_cast<long>(opt_.page_step));
            return;
        case key::PageDown:
            moveCursor(static_cast<long>(opt_.page_step));
            return;
        case key::Home:
            cursorTo(0);
            return;
        case key::End:
            cursorTo(activePane().entries.empty() ? 0 : activePane().entries.size() - 1);
            return;
        case key::Enter:
        case '\r':
        case key::Right:
        case 'l':
            openEntry();
            return;
        case key::Left:
        case 'h':
        case key::Backspace:
        case '\b':
            goParent();
            return;
        case key::Tab:
            switchPane();
            return;
        case ' ':
            toggleMark();
            return;
        case 'c':
        case 'C':
            if (refuseWhileBusy()) return;
            toggleConnection();
            return;
        case 's':
        case 'S':
            if (refuseWhileBusy()) return;
            if (connected_) {
                setMessage(MessageKind::Info, "Disconnect (c) before changing the server");
                return;
            }
            openInput(InputPurpose::Address, "Server URL: ", formatUrl(targetAddress()));
            return;
        case 'u':
            requestCopy(JobKind::Upload);
            return;
        case 'd':
            requestCopy(JobKind::Download);
            return;
        case 'D':
            requestDelete();
            return;
        case 'r': {
            if (refuseWhileBusy()) return;
            if (active_ == Side::Remote && !remoteUsable()) return;
            const DirEntry* e = activePane().current();
            if (!e || e->name == "..") return;
            renameFrom_ = e->name;
            openInput(InputPurpose::Rename, "Rename '" + e->name + "' to: ", e->name);
            return;
        }
        case 'm':
            if (refuseWhileBusy()) return;
            if (active_ == Side::Remote && !remoteUsable()) return;
            openInput(InputPurpose::Mkdir, "New directory in " + endpoint(active_).cwd() + ": ", std::string());
            return;
        case 'v':
            openViewer();
            return;
        case 'e':
            beginEdit();
            return;
        case 'R':
            if (active_ == Side::Remote && !remoteUsable()) return;
            if (refresh(active_)) setMessage(MessageKind::Info, "Refreshed");
            return;
        case '/':
        case 'f':
            openInput(InputPurpose::Search, "Search: ", std::string());
            return;
        default:
            return;
    }
}

void SessionController::handleModalKey(int k) {
    switch (modal_.kind) {
        case ModalKind::ConfirmDelete:
        case ModalKind::ConfirmOverwrite: {
            const bool yes = k == key::Enter || k == '\r' || k == 'y' || k == 'Y';
            const ModalKind kind = modal_.kind;
            std::vector<DirEntry> items = std::move(pendingItems_);
            pendingItems_.clear();
            closeModal();
            if (!yes) {
                setMessage(MessageKind::Info, kind == ModalKind::ConfirmDelete ? "Delete cancelled" : "Transfer cancelled");
                return;
            }
            if (refuseWhileBusy()) return;
            if (kind == ModalKind::ConfirmDelete) startDelete(items);
            else startCopy(pendingKind_, items);
            return;
        }
        case ModalKind::TextInput:
            if (k == key::Escape) {
                closeModal();
            } else if (k == key::Enter || k == '\r') {
                submitInput();
            } else if (k == key::Backspace || k == '\b') {
                // Drop one UTF-8 sequence
                std::string& in = modal_.input;
                while (!in.empty() && (static_cast<unsigned char>(in.back()) & 0xC0) == 0x80) in.pop_back();
                if (!in.empty()) in.pop_back();
                modal_.error.clear();
            } else if (k >= 32 && k < 256) {
                modal_.input.push_back(static_cast<char>(k));
                modal_.error.clear();
            }
            return;
        case ModalKind::Viewer: {
            const std::size_t maxScroll = modal_.lines.size() > viewRows_ ? modal_.lines.size() - viewRows_ : 0;
            std::size_t& sc = modal_.scroll;
            switch (k) {
                case 'q':
                case 'Q':
                case key::Escape:
                    closeModal();
                    return;
                case key::Up:
                case 'k':
                    if (sc > 0) --sc;
                    return;
                case key::Down:
                case 'j':
                    if (sc < maxScroll) ++sc;
                    return;
                case key::PageUp:
                    sc = sc > viewRows_ ? sc - viewRows_ : 0;
                    return;
                case key::PageDown:
                case ' ':
                    sc = std::min(maxScroll, sc + viewRows_);
                    return;
                case key::Home:
                    sc = 0;
                    return;
                case key::End:
                    sc = maxScroll;
                    return;
                default:
                    return;
            }
        }
        case ModalKind::Editor:
        case ModalKind::None:
            return;
    }
}

void SessionController::closeModal() {
    modal_ = ModalView();
}

void SessionController::openInput(InputPurpose purpose, const std::string& title, const std::string& prefill) {
    modal_ = ModalView();
    modal_.kind = ModalKind::TextInput;
    modal_.purpose = purpose;
    modal_.title = title;
    modal_.input = prefill;
}

bool SessionController::validateName(const std::string& name, std::string& why) const {
    if (name == "." || name == "..") {
        why = "'" + name + "' is not a valid name";
        return false;
    }
    if (name.find('/') != std::string::npos) {
        why = "Name must not contain '/'";
        return false;
    }
    // A fresh listing also sees hidden entries the pane filters out
    std::vector<DirEntry> fresh;
    Error err;
    Endpoint& ep = endpoint(active_);
    const std::vector<DirEntry>& known = ep.list(ep.cwd(), fresh, err) ? fresh : pane(active_).entries;
    for (const DirEntry& e : known) {
        if (e.name == name) {
            why = "'" + name + "' already exists";
            return false;
        }
    }
    return true;
}

void SessionController::submitInput() {
    const std::string text = modal_.input;
    const InputPurpose purpose = modal_.purpose;

    if (purpose == InputPurpose::Search) {
        closeModal();
        if (!text.empty()) runSearch(text);
        return;
    }

    if (purpose == InputPurpose::Address) {
        if (text.empty()) {
            closeModal();
            return;
        }
        Address a;
        Error err;
        if (!parseUrl(text, a, err)) {
            modal_.error = err.message;
            return;
        }
        target_ = a;
        closeModal();
        setMessage(MessageKind::Info, "Server set to " + a.display() + " (c to connect)");
        return;
    }

    // Rename / Mkdir
    if (text.empty() || (purpose == InputPurpose::Rename && text == renameFrom_)) {
        closeModal();
        return;
    }
    if (active_ == Side::Remote && !remoteUsable()) {
        closeModal();
        return;
    }
    std::string why;
    if (!validateName(text, why)) {
        LOGI("rejected name '%s': %s", text.c_str(), why.c_str());
        modal_.error = why;
        return;
    }
    closeModal();

    Endpoint& ep = endpoint(active_);
    const std::uint64_t token = nextToken_++;
    PendingBatch pb;
    pb.token = token;
    pb.origin = active_;
    pb.from_selection = false;
    Batch b;
    if (purpose == InputPurpose::Rename) {
        pb.kind = JobKind::Rename;
        b = TransferPlanner::planRename(ep, ep.join(ep.cwd(), renameFrom_), ep.join(ep.cwd(), text), token);
    } else {
        pb.kind = JobKind::Mkdir;
        b = TransferPlanner::planMkdir(ep, ep.join(ep.cwd(), text), token);
    }
    enqueue(std::move(b), pb);
}

void SessionController::runSearch(const std::string& query) {
    const std::string q = lowered(query);
    const Pane& p = activePane();
    std::size_t first = p.entries.size();
    std::size_t matches = 0;
    for (std::size_t i = 0; i < p.entries.size(); ++i) {
        const DirEntry& e = p.entries[i];
        if (e.name == ".." || lowered(e.name).find(q) == std::string::npos) continue;
        if (matches++ == 0) first = i;
    }
    if (matches == 0) {
        setMessage(MessageKind::Info, "No results for '" + query + "'");
        return;
    }
    cursorTo(first);
    setMessage(MessageKind::Success, "Found " + std::to_string(matches) + " result(s) for '" + query + "'");
}

// ---- connection ----

void SessionController::toggleConnection() {
    if (connected_) {
        disconnect("Disconnected");
        return;
    }
    connectTo(target_);
}

bool SessionController::connectTo(const std::optional<Address>& addr) {
    Error err;
    const bool ok = addr ? connector_.connect(*addr, err) : connector_.ensureConnected(err);
    if (!ok) {
        connected_ = false;
        setMessage(MessageKind::Error, "Not connected: " + err.describe() + " (s: set server, c: retry)");
        return false;
    }
    afterConnect();
    return true;
}

void SessionController::afterConnect() {
    connected_ = true;
    const Address& a = connector_.address();
    std::string dir = a.path;
    if (dir.empty()) {
        Error err;
        Session* s = connector_.session();
        if (!s || !s->currentDirectory(dir, err) || dir.empty()) {
            LOGW("no login directory (%s), using /", err.describe().c_str());
            dir = "/";
        }
    }
    remote_.setCwd(dir);
    remotePane_ = Pane();
    remotePane_.side = Side::Remote;
    setMessage(MessageKind::Success, "Connected to " + a.display());
    refresh(Side::Remote);
}

void SessionController::disconnect(const std::string& why) {
    connector_.disconnect();
    connected_ = false;
    remotePane_ = Pane();
    remotePane_.side = Side::Remote;
    setMessage(MessageKind::Info, why);
}

void SessionController::connectionLost(const Error& err) {
    LOGW("connection lost: %s", err.describe().c_str());
    disconnect("Connection lost: " + err.describe() + " (c to reconnect)");
    message_.kind = MessageKind::Error;
}

// ---- batches ----

bool SessionController::planUsable(const Batch& batch) {
    for (const PlanFailure& f : batch.plan_failures) {
        if (isConnectionFatal(f.error.code)) {
            connectionLost(f.error);
            return false;
        }
    }
    if (batch.jobs.empty()) {
        if (batch.plan_failures.empty()) setMessage(MessageKind::Info, "Nothing to do");
        else setMessage(MessageKind::Error, "Nothing to do: " + batch.plan_failures.front().error.describe());
        return false;
    }
    return true;
}

void SessionController::requestCopy(JobKind kind) {
    if (refuseWhileBusy()) return;
    const Side from = kind == JobKind::Upload ? Side::Local : Side::Remote;
    const Side to = from == Side::Local ? Side::Remote : Side::Local;
    if (active_ != from) {
        setMessage(MessageKind::Info, kind == JobKind::Upload ? "Upload works in the local pane; press d to download"
                                                              : "Download works in the remote pane; press u to upload");
        return;
    }
    if (!connected_) {
        setMessage(MessageKind::Error, "Not connected (c to connect)");
        return;
    }
    std::vector<DirEntry> items = markedOrCurrent(from);
    if (items.empty()) return;

    Endpoint& dst = endpoint(to);
    std::vector<DirEntry> existing;
    Error err;
    if (!dst.list(dst.cwd(), existing, err)) {
        if (isConnectionFatal(err.code)) {
            connectionLost(err);
            return;
        }
        existing = pane(to).entries;
    }
    std::vector<std::string> clashes;
    for (const DirEntry& item : items) {
        bool taken = std::any_of(existing.begin(), existing.end(),
                                 [&](const DirEntry& e) { return e.name == item.name; });
        if (taken) clashes.push_back(item.name);
    }
    if (!clashes.empty()) {
        pendingItems_ = std::move(items);
        pendingKind_ = kind;
        modal_ = ModalView();
        modal_.kind = ModalKind::ConfirmOverwrite;
        modal_.title = clashes.size() == 1
                           ? "Overwrite '" + clashes.front() + "' in " + dst.cwd() + "?"
                           : "Overwrite " + std::to_string(clashes.size()) + " existing items in " + dst.cwd() + "?";
        return;
    }
    startCopy(kind, items);
}

void SessionController::startCopy(JobKind kind, const std::vector<DirEntry>& items) {
    Endpoint& src = kind == JobKind::Upload ? local_ : remote_;
    Endpoint& dst = kind == JobKind::Upload ? remote_ : local_;
    const std::uint64_t token = nextToken_++;
    Batch b = TransferPlanner::planCopy(kind, src, src.cwd(), items, dst, dst.cwd(), token);
    if (!planUsable(b)) return;
    PendingBatch pb;
    pb.token = token;
    pb.kind = kind;
    pb.origin = src.side();
    enqueue(std::move(b), pb);
}

void SessionController::requestDelete() {
    if (refuseWhileBusy()) return;
    if (active_ == Side::Remote && !remoteUsable()) return;
    std::vector<DirEntry> items = markedOrCurrent(active_);
    if (items.empty()) return;
    modal_ = ModalView();
    modal_.kind = ModalKind::ConfirmDelete;
    if (items.size() == 1)
        modal_.title = "Delete '" + items.front().name + (items.front().isDir() ? "/" : "") + "'?";
    else
        modal_.title = "Delete " + std::to_string(items.size()) + " items?";
    pendingItems_ = std::move(items);
}

void SessionController::startDelete(const std::vector<DirEntry>& items) {
    if (active_ == Side::Remote && !remoteUsable()) return;
    Endpoint& ep = endpoint(active_);
    const std::uint64_t token = nextToken_++;
    Batch b = TransferPlanner::planDelete(ep, ep.cwd(), items, token);
    if (!planUsable(b)) return;
    PendingBatch pb;
    pb.token = token;
    pb.kind = JobKind::Delete;
    pb.origin = active_;
    enqueue(std::move(b), pb);
}

bool SessionController::enqueue(Batch batch, PendingBatch pending) {
    ProgressSnapshot first;
    first.batch_token = batch.token;
    first.bytes_total = batch.bytes_total;
    first.job_count = batch.jobs.size();
    progress_ = first;
    batch_ = pending;
    LOGI("controller: %s batch #%llu from %s, %zu jobs", jobKindName(batch.kind),
         (unsigned long long)batch.token, sideName(pending.origin), batch.jobs.size());
    setMessage(MessageKind::Info, std::string(jobKindName(batch.kind)) + " started (" +
                                      std::to_string(batch.jobs.size()) + " jobs)");
    queue_.enqueue(std::move(batch));
    return true;
}

void SessionController::cancelBatch() {
    if (!batch_) return;
    if (queue_.cancel(batch_->token)) setMessage(MessageKind::Info, "Cancelling transfer...");
}

void SessionController::requestQuit() {
    if (batch_) {
        quitting_ = true;
        queue_.cancel(batch_->token);
        setMessage(MessageKind::Info, "Cancelling transfer before quitting...");
        return;
    }
    if (connected_) connector_.disconnect();
    connected_ = false;
    quit_ = true;
}

void SessionController::tick() {
    for (const ProgressSnapshot& s : queue_.pollProgress()) {
        if (batch_ && s.batch_token == batch_->token) progress_ = s;
    }
    while (std::optional<BatchResult> r = queue_.takeResult()) finishBatch(std::move(*r));
}

void SessionController::finishBatch(BatchResult r) {
    if (!batch_ || r.batch.token != batch_->token) {
        LOGW("controller: result for unknown batch #%llu", (unsigned long long)r.batch.token);
        return;
    }
    const PendingBatch pending = *batch_;
    batch_.reset();
    progress_.reset();

    if (r.started && pending.from_selection) paneFor(pending.origin).selection.clear();

    if (pending.edit) {
        finishEdit(r, pending);
    } else if (r.outcome == BatchOutcome::ConnectionLost) {
        connectionLost(r.connection_error);
    } else if (!r.started) {
        setMessage(MessageKind::Info, "Transfer cancelled before it started");
    } else {
        std::string text = r.summary();
        MessageKind kind = MessageKind::Success;
        if (r.outcome == BatchOutcome::Cancelled) {
            kind = MessageKind::Info;
        } else if (r.outcome == BatchOutcome::Partial) {
            kind = MessageKind::Error;
            if (const Error* e = r.firstError()) text += " - " + e->describe();
        }
        setMessage(kind, text);
    }

    if (quitting_) {
        if (connected_) connector_.disconnect();
        connected_ = false;
        quit_ = true;
        return;
    }

    const StatusMessage keep = message_;
    bool ok = refresh(Side::Local);
    if (connected_) ok = refresh(Side::Remote) && ok;
    // A failing re-list reports itself instead
    if (ok) message_ = keep;
}

// ---- viewer / editor ----

void SessionController::openViewer() {
    if (refuseWhileBusy()) return;
    if (active_ != Side::Remote) {
        setMessage(MessageKind::Info, "View works on remote files");
        return;
    }
    if (!remoteUsable()) return;
    const DirEntry* e = remotePane_.current();
    if (!e || e->isDir()) return;
    const std::string name = e->name;

    std::string text;
    bool truncated = false;
    Error err;
    if (!remote_.readText(remote_.join(remote_.cwd(), name), opt_.viewer_limit, text, truncated, err)) {
        if (isConnectionFatal(err.code)) connectionLost(err);
        else setMessage(MessageKind::Error, "Cannot view " + name + ": " + err.describe());
        return;
    }
    if (text.find('\0') != std::string::npos) {
        setMessage(MessageKind::Error, "Cannot view " + name + ": binary file");
        return;
    }

    modal_ = ModalView();
    modal_.kind = ModalKind::Viewer;
    modal_.title = name;
    if (truncated) modal_.title += " (first " + std::to_string(opt_.viewer_limit / 1024) + " KiB)";
    std::string line;
    for (char c : text) {
        if (c == '\n') {
            modal_.lines.push_back(line);
            line.clear();
        } else if (c == '\t') {
            line += "    ";
        } else if (c != '\r') {
            line += c;
        }
    }
    if (!line.empty()) modal_.lines.push_back(line);
}

void SessionController::beginEdit() {
    if (refuseWhileBusy()) return;
    if (active_ != Side::Remote) {
        setMessage(MessageKind::Info, "Edit works on remote files");
        return;
    }
    if (!remoteUsable()) return;
    const DirEntry* e = remotePane_.current();
    if (!e || e->isDir()) return;

    std::string dir = opt_.temp_dir;
    if (dir.empty()) {
        std::error_code ec;
        dir = fs::temp_directory_path(ec).string();
        if (ec || dir.empty()) dir = "/tmp";
    }
    // Keep the name as suffix so the editor picks the right syntax
    std::string tmpl = dir + "/ftpdeck-XXXXXX_" + e->name;
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    int fd = ::mkstemps(buf.data(), static_cast<int>(e->name.size() + 1));
    if (fd < 0) {
        setMessage(MessageKind::Error, std::string("Cannot create temporary file: ") + std::strerror(errno));
        return;
    }
    ::close(fd);

    EditSession es;
    es.temp_path = buf.data();
    es.remote_path = remote_.join(remote_.cwd(), e->name);
    es.name = e->name;
    edit_ = es;

    const std::uint64_t token = nextToken_++;
    Batch b = TransferPlanner::planFile(JobKind::Download, remote_, es.remote_path, local_, es.temp_path,
                                        e->size_bytes, token);
    PendingBatch pb;
    pb.token = token;
    pb.kind = JobKind::Download;
    pb.origin = Side::Remote;
    pb.from_selection = false;
    pb.edit = true;
    enqueue(std::move(b), pb);
}

void SessionController::dropEditCopy() {
    if (!edit_) return;
    std::error_code ec;
    fs::remove(edit_->temp_path, ec);
    if (ec) LOGW("could not remove %s: %s", edit_->temp_path.c_str(), ec.message().c_str());
    edit_.reset();
}

void SessionController::finishEdit(const BatchResult& r, const PendingBatch& pending) {
    if (!edit_) return;
    const std::string name = edit_->name;
    const Error* failure = r.firstError();

    if (!pending.edit_upload) {
        if (r.outcome != BatchOutcome::Completed || !fileStamp(edit_->temp_path, edit_->mtime_ns, edit_->size)) {
            dropEditCopy();
            if (r.outcome == BatchOutcome::ConnectionLost) connectionLost(r.connection_error);
            else if (failure) setMessage(MessageKind::Error, "Edit failed: " + failure->describe());
            else setMessage(MessageKind::Info, "Edit of " + name + " " + batchOutcomeName(r.outcome));
            return;
        }
        modal_ = ModalView();
        modal_.kind = ModalKind::Editor;
        modal_.title = "Editing " + name;
        return;
    }

    dropEditCopy();
    if (r.outcome == BatchOutcome::Completed) setMessage(MessageKind::Success, "Changes saved to " + name);
    else if (r.outcome == BatchOutcome::ConnectionLost) connectionLost(r.connection_error);
    else if (failure) setMessage(MessageKind::Error, "Could not save " + name + ": " + failure->describe());
    else setMessage(MessageKind::Info, "Saving " + name + " " + batchOutcomeName(r.outcome));
}

void SessionController::runPendingEdit() {
    if (!editPending()) return;
    closeModal();
    if (!edit_) return;

    Error err;
    if (!editor_) err.set(ErrorCode::IOError, "no editor configured");
    if (!editor_ || !editor_->edit(edit_->temp_path, err)) {
        dropEditCopy();
        setMessage(MessageKind::Error, "Editor failed: " + err.describe());
        return;
    }

    long long mtime = 0;
    std::uintmax_t size = 0;
    if (!fileStamp(edit_->temp_path, mtime, size)) {
        dropEditCopy();
        setMessage(MessageKind::Error, "Edited copy disappeared");
        return;
    }
    if (mtime == edit_->mtime_ns && size == edit_->size) {
        dropEditCopy();
        setMessage(MessageKind::Info, "No changes made");
        return;
    }
    if (!connected_) {
        dropEditCopy();
        setMessage(MessageKind::Error, "Not connected; changes discarded");
        return;
    }

    const std::uint64_t token = nextToken_++;
    Batch b = TransferPlanner::planFile(JobKind::Upload, local_, edit_->temp_path, remote_, edit_->remote_path,
                                        static_cast<std::uint64_t>(size), token);
    PendingBatch pb;
    pb.token = token;
    pb.kind = JobKind::Upload;
    pb.origin = Side::Local;
    pb.from_selection = false;
    pb.edit = true;
    pb.edit_upload = true;
    enqueue(std::move(b), pb);
}

} // namespace ftpdeck
