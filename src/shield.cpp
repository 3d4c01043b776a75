#include "shield.hpp"

#include "json.hpp"
#include "shared_state.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace {

// ─────────────────────────────────────
std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// ─────────────────────────────────────
std::string NormalizeDomain(std::string domain) {
    domain = Lower(domain);
    for (const char *scheme : {"https://", "http://"}) {
        const std::string prefix = scheme;
        if (domain.rfind(prefix, 0) == 0) {
            domain.erase(0, prefix.size());
        }
    }
    if (domain.rfind("www.", 0) == 0) {
        domain.erase(0, 4);
    }
    if (auto slash = domain.find('/'); slash != std::string::npos) {
        domain.erase(slash);
    }
    return domain;
}

} // namespace

// ─────────────────────────────────────
ShieldFile::ShieldFile(std::filesystem::path path) : m_Path(std::move(path)) {
    std::error_code ec;
    std::filesystem::create_directories(m_Path.parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create shield directory {}: {}", m_Path.parent_path().string(),
                      ec.message());
    }
}

// ─────────────────────────────────────
ShieldState ShieldFile::Load() const {
    ShieldState state;
    std::ifstream in(m_Path);
    if (!in) {
        return state;
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception &e) {
        spdlog::warn("Shield file {} unreadable: {}", m_Path.string(), e.what());
        return state;
    }

    JsonParse parse;
    state.active = parse.GetBool(j, "active", false);
    state.updatedAt = FromUnix(parse.GetInt64(j, "updated_at", 0));
    if (j.contains("tokens")) {
        state.tokens = TokenSetFromJson(j["tokens"]);
    }
    return state;
}

// ─────────────────────────────────────
void ShieldFile::Save(const ShieldState &state) {
    const nlohmann::json j = {
        {"active", state.active},
        {"tokens", TokenSetToJson(state.tokens)},
        {"updated_at", ToUnix(state.updatedAt)},
    };

    // Both processes write here; a per-process temporary keeps their renames apart.
    const std::filesystem::path tmp =
        m_Path.string() + "." + std::to_string(::getpid()) + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            throw std::runtime_error("cannot write shield file " + tmp.string());
        }
        out << j.dump(2) << "\n";
        if (!out.good()) {
            throw std::runtime_error("short write to shield file " + tmp.string());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, m_Path, ec);
    if (ec) {
        throw std::runtime_error("cannot install shield file " + m_Path.string() + ": " +
                                 ec.message());
    }
}

// ─────────────────────────────────────
void ShieldFile::Apply(const TokenSet &tokens) {
    Save({!tokens.Empty(), tokens, Now()});
    spdlog::debug("Shield applied: {} tokens", tokens.Size());
}

// ─────────────────────────────────────
void ShieldFile::Clear() {
    Save({false, TokenSet{}, Now()});
    spdlog::debug("Shield cleared");
}

// ─────────────────────────────────────
TokenSet ShieldFile::Current() {
    ShieldState state = Load();
    return state.active ? state.tokens : TokenSet{};
}

// ─────────────────────────────────────
ShieldPolicy::ShieldPolicy(const TokenSet &tokens, const CategoryMap &categories) {
    for (const auto &app : tokens.applications) {
        m_AppIds.push_back(Lower(app));
    }
    for (const auto &category : tokens.categories) {
        auto it = categories.find(category);
        if (it == categories.end()) {
            spdlog::debug("Shield: unknown category '{}'", category);
            continue;
        }
        for (const auto &app : it->second) {
            m_AppIds.push_back(Lower(app));
        }
    }
    for (const auto &domain : tokens.webDomains) {
        std::string d = NormalizeDomain(domain);
        if (!d.empty()) {
            m_Domains.push_back(std::move(d));
        }
    }
}

// ─────────────────────────────────────
bool ShieldPolicy::Empty() const {
    return m_AppIds.empty() && m_Domains.empty();
}

// ─────────────────────────────────────
bool ShieldPolicy::Blocks(const std::string &appId, const std::string &title) const {
    const std::string app = Lower(appId);
    if (!app.empty() && std::find(m_AppIds.begin(), m_AppIds.end(), app) != m_AppIds.end()) {
        return true;
    }

    // Browsers put the page host or name in the title.
    const std::string lowTitle = Lower(title);
    for (const auto &domain : m_Domains) {
        if (lowTitle.find(domain) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ─────────────────────────────────────
ShieldWatcher::ShieldWatcher(ShieldFile &shield, CategoryMap categories)
    : m_Shield(shield), m_Categories(std::move(categories)) {}

// ─────────────────────────────────────
ShieldWatcher::~ShieldWatcher() {
    Stop();
}

// ─────────────────────────────────────
bool ShieldWatcher::Start() {
    if (!m_Niri.IsAvailable()) {
        spdlog::warn("NIRI_SOCKET not set; shield cannot close windows");
        return false;
    }
    return m_Niri.StartEventStream([this](const nlohmann::json &) { Enforce(); },
                                   {"WindowOpenedOrChanged"});
}

// ─────────────────────────────────────
void ShieldWatcher::Stop() {
    m_Niri.StopEventStream();
}

// ─────────────────────────────────────
void ShieldWatcher::SetEnabled(bool enabled) {
    if (m_Enabled.exchange(enabled) != enabled) {
        spdlog::debug("Shield watcher {}", enabled ? "enabled" : "disabled");
    }
}

// ─────────────────────────────────────
bool ShieldWatcher::Enabled() const {
    return m_Enabled.load();
}

// ─────────────────────────────────────
std::size_t ShieldWatcher::Enforce() {
    if (!m_Enabled.load()) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(m_Mutex);

    const ShieldState state = m_Shield.Load();
    if (!state.active) {
        return 0;
    }

    const ShieldPolicy policy(state.tokens, m_Categories);
    if (policy.Empty()) {
        return 0;
    }

    auto windows = m_Niri.Windows();
    if (!windows) {
        if (!m_WarnedUnavailable.exchange(true)) {
            spdlog::warn("Shield: cannot list windows through niri");
        }
        return 0;
    }
    m_WarnedUnavailable.store(false);

    std::size_t closed = 0;
    for (const auto &w : *windows) {
        if (!policy.Blocks(w.appId, w.title)) {
            continue;
        }
        if (m_Niri.CloseWindow(w.id)) {
            spdlog::info("Shield: closed {} ({})", w.appId, w.title);
            ++closed;
        } else {
            spdlog::warn("Shield: failed to close window {} ({})", w.id, w.appId);
        }
    }
    return closed;
}
