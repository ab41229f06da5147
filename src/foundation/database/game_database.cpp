/// @file game_database.cpp
/// @brief GameDatabase implementation over kcenon database_system.

#include "fxp/foundation/game_database.hpp"

// kcenon database_system headers (hidden behind PIMPL)
#include <database_manager.h>
#include <core/database_backend.h>
#include <core/database_context.h>
#include <database_types.h>

#include <atomic>
#include <cctype>
#include <charconv>
#include <condition_variable>
#include <mutex>
#include <type_traits>
#include <utility>

#include "fxp/foundation/game_logger.hpp"
#include "fxp/foundation/time_utils.hpp"

namespace fxp::foundation {

namespace {

using Manager = ::database::database_manager;

bool isPlaceholderChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

void appendQuoted(std::string& out, std::string_view text) {
    out += '\'';
    for (char c : text) {
        if (c == '\'') {
            out += '\'';
        }
        out += c;
    }
    out += '\'';
}

QueryResult toRows(const ::database::core::database_result& source) {
    QueryResult rows;
    rows.reserve(source.size());
    for (const auto& sourceRow : source) {
        DbRow row;
        for (const auto& [column, value] : sourceRow) {
            row[column] = std::visit(
                [](auto&& v) -> DbValue {
                    using T = std::decay_t<decltype(v)>;
                    if constexpr (std::is_same_v<T, std::string> ||
                                  std::is_same_v<T, std::int64_t> ||
                                  std::is_same_v<T, bool>) {
                        return v;
                    } else if constexpr (std::is_same_v<T, double>) {
                        return static_cast<std::int64_t>(v);
                    } else {
                        return DbNull{};
                    }
                },
                value);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

GameResult<QueryResult> runQuery(Manager& manager, std::string_view sql) {
    auto result = manager.select_query_result(std::string(sql));
    if (!result.is_ok()) {
        return GameResult<QueryResult>::err(
            GameError(ErrorCode::QueryFailed, result.error().message));
    }
    return GameResult<QueryResult>::ok(toRows(result.value()));
}

GameResult<void> runCommand(Manager& manager, std::string_view sql) {
    auto result = manager.execute_query_result(std::string(sql));
    if (!result.is_ok()) {
        return GameResult<void>::err(GameError(ErrorCode::QueryFailed, result.error().message));
    }
    return GameResult<void>::ok();
}

GameError notActive() {
    return GameError(ErrorCode::TransactionFailed, "transaction not active");
}

} // namespace

// ---------------------------------------------------------------------------
// Row accessors
// ---------------------------------------------------------------------------

std::int64_t dbInt(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return 0;
    }
    if (const auto* value = std::get_if<std::int64_t>(&it->second)) {
        return *value;
    }
    if (const auto* flag = std::get_if<bool>(&it->second)) {
        return *flag ? 1 : 0;
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        std::int64_t value = 0;
        std::from_chars(text->data(), text->data() + text->size(), value);
        return value;
    }
    return 0;
}

std::string dbText(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    if (it == row.end()) {
        return {};
    }
    if (const auto* text = std::get_if<std::string>(&it->second)) {
        return *text;
    }
    if (const auto* value = std::get_if<std::int64_t>(&it->second)) {
        return std::to_string(*value);
    }
    if (const auto* flag = std::get_if<bool>(&it->second)) {
        return *flag ? "1" : "0";
    }
    return {};
}

bool dbIsNull(const DbRow& row, const std::string& column) {
    auto it = row.find(column);
    return it == row.end() || std::holds_alternative<DbNull>(it->second);
}

std::optional<Timestamp> dbTimestamp(const DbRow& row, const std::string& column) {
    if (dbIsNull(row, column)) {
        return std::nullopt;
    }
    return parseIso8601(dbText(row, column));
}

// ---------------------------------------------------------------------------
// PreparedStatement
// ---------------------------------------------------------------------------

PreparedStatement::PreparedStatement(std::string sql)
    : sql_(std::move(sql)) {}

PreparedStatement& PreparedStatement::bindString(std::string_view name, std::string value) {
    params_[std::string(name)] = std::move(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindInt(std::string_view name, std::int64_t value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindBool(std::string_view name, bool value) {
    params_[std::string(name)] = value;
    return *this;
}

PreparedStatement& PreparedStatement::bindTimestamp(std::string_view name, Timestamp value) {
    params_[std::string(name)] = formatIso8601(value);
    return *this;
}

PreparedStatement& PreparedStatement::bindNull(std::string_view name) {
    params_[std::string(name)] = DbNull{};
    return *this;
}

std::string PreparedStatement::resolve() const {
    std::string out;
    out.reserve(sql_.size());

    std::size_t pos = 0;
    while (pos < sql_.size()) {
        if (sql_[pos] != '$') {
            out += sql_[pos++];
            continue;
        }
        auto end = pos + 1;
        while (end < sql_.size() && isPlaceholderChar(sql_[end])) {
            ++end;
        }
        auto it = params_.find(sql_.substr(pos + 1, end - pos - 1));
        if (it == params_.end()) {
            out.append(sql_, pos, end - pos);
        } else if (const auto* text = std::get_if<std::string>(&it->second)) {
            appendQuoted(out, *text);
        } else if (const auto* value = std::get_if<std::int64_t>(&it->second)) {
            out += std::to_string(*value);
        } else if (const auto* flag = std::get_if<bool>(&it->second)) {
            out += *flag ? '1' : '0';
        } else {
            out += "NULL";
        }
        pos = end;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Connection pool
// ---------------------------------------------------------------------------

namespace detail {

class ConnectionPool {
public:
    struct Slot {
        std::shared_ptr<::database::database_context> context;
        std::shared_ptr<Manager> manager;
        bool leased = false;
    };

    /// Returns its connection to the pool on destruction.
    class Lease {
    public:
        Lease() = default;
        Lease(ConnectionPool* owner, std::shared_ptr<Manager> manager)
            : owner_(owner), manager_(std::move(manager)) {}
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), manager_(std::move(other.manager_)) {}
        Lease& operator=(Lease&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = std::exchange(other.owner_, nullptr);
                manager_ = std::move(other.manager_);
            }
            return *this;
        }

        explicit operator bool() const noexcept { return manager_ != nullptr; }
        Manager& operator*() const noexcept { return *manager_; }

    private:
        void release() {
            if (owner_ && manager_) {
                owner_->giveBack(manager_.get());
            }
            owner_ = nullptr;
            manager_.reset();
        }

        ConnectionPool* owner_ = nullptr;
        std::shared_ptr<Manager> manager_;
    };

    DatabaseConfig config;
    std::vector<Slot> slots;
    mutable std::mutex mutex;
    std::condition_variable released;
    std::atomic<bool> connected{false};

    GameResult<Slot> openConnection() const {
        Slot slot;
        slot.context = std::make_shared<::database::database_context>();
        slot.manager = std::make_shared<Manager>(slot.context);

        if (!slot.manager->set_mode(::database::database_types::sqlite)) {
            return GameResult<Slot>::err(
                GameError(ErrorCode::DatabaseError, "SQLite backend is not available"));
        }
        auto opened = slot.manager->connect_result(config.connectionString);
        if (!opened.is_ok()) {
            return GameResult<Slot>::err(GameError(
                ErrorCode::DatabaseError,
                "cannot open " + config.connectionString + ": " + opened.error().message));
        }
        auto pragma = runCommand(*slot.manager, "PRAGMA busy_timeout = " +
                                                    std::to_string(config.busyTimeout.count()));
        if (!pragma) {
            (void)slot.manager->disconnect_result();
            return GameResult<Slot>::err(pragma.error());
        }
        return GameResult<Slot>::ok(std::move(slot));
    }

    // Waits up to connectionTimeout for a free slot, opening new ones up
    // to maxConnections.
    GameResult<Lease> lease() {
        std::unique_lock lock(mutex);
        auto deadline = std::chrono::steady_clock::now() + config.connectionTimeout;

        while (true) {
            if (!connected.load()) {
                return GameResult<Lease>::err(
                    GameError(ErrorCode::NotConnected, "not connected to database"));
            }
            for (auto& slot : slots) {
                if (!slot.leased) {
                    slot.leased = true;
                    return GameResult<Lease>::ok(Lease(this, slot.manager));
                }
            }
            if (slots.size() < config.maxConnections) {
                auto slot = openConnection();
                if (!slot) {
                    return GameResult<Lease>::err(slot.error());
                }
                slots.push_back(std::move(slot).value());
                slots.back().leased = true;
                return GameResult<Lease>::ok(Lease(this, slots.back().manager));
            }
            if (released.wait_until(lock, deadline) == std::cv_status::timeout) {
                return GameResult<Lease>::err(GameError(
                    ErrorCode::ConnectionPoolExhausted,
                    "no database connection free after " +
                        std::to_string(config.connectionTimeout.count()) + "s"));
            }
        }
    }

    void giveBack(const Manager* manager) {
        {
            std::lock_guard lock(mutex);
            for (auto& slot : slots) {
                if (slot.manager.get() == manager) {
                    slot.leased = false;
                    break;
                }
            }
        }
        released.notify_one();
    }
};

} // namespace detail

struct GameDatabase::Impl : detail::ConnectionPool {};

// ---------------------------------------------------------------------------
// Transaction
// ---------------------------------------------------------------------------

struct Transaction::Impl {
    detail::ConnectionPool::Lease lease;
    bool active = true;

    GameResult<void> finish(bool commit) {
        active = false;
        std::string failure;
        if (commit) {
            if (auto result = (*lease).commit_transaction(); !result.is_ok()) {
                failure = "commit failed: " + result.error().message;
            }
        } else {
            if (auto result = (*lease).rollback_transaction(); !result.is_ok()) {
                failure = "rollback failed: " + result.error().message;
            }
        }
        lease = {};
        if (!failure.empty()) {
            return GameResult<void>::err(GameError(ErrorCode::TransactionFailed, failure));
        }
        return GameResult<void>::ok();
    }
};

Transaction::Transaction(std::unique_ptr<Impl> impl)
    : impl_(std::move(impl)) {}

Transaction::~Transaction() {
    if (impl_ && impl_->active) {
        if (auto rolledBack = impl_->finish(false); !rolledBack) {
            FXP_LOG_WARN(LogCategory::Database, rolledBack.error().describe());
        }
    }
}

Transaction::Transaction(Transaction&&) noexcept = default;

Transaction& Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        if (impl_ && impl_->active) {
            (void)impl_->finish(false);
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

GameResult<void> Transaction::commit() {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    return impl_->finish(true);
}

GameResult<void> Transaction::rollback() {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    return impl_->finish(false);
}

GameResult<QueryResult> Transaction::query(std::string_view sql) {
    if (!isActive()) {
        return GameResult<QueryResult>::err(notActive());
    }
    return runQuery(*impl_->lease, sql);
}

GameResult<void> Transaction::execute(std::string_view sql) {
    if (!isActive()) {
        return GameResult<void>::err(notActive());
    }
    return runCommand(*impl_->lease, sql);
}

bool Transaction::isActive() const noexcept {
    return impl_ && impl_->active;
}

// ---------------------------------------------------------------------------
// GameDatabase
// ---------------------------------------------------------------------------

GameDatabase::GameDatabase()
    : impl_(std::make_unique<Impl>()) {}

GameDatabase::~GameDatabase() {
    disconnect();
}

GameResult<void> GameDatabase::connect(const DatabaseConfig& config) {
    std::lock_guard lock(impl_->mutex);
    if (impl_->connected.load()) {
        return GameResult<void>::err(GameError(ErrorCode::AlreadyExists, "already connected"));
    }
    if (config.maxConnections == 0) {
        return GameResult<void>::err(
            GameError(ErrorCode::InvalidArgument, "at least one connection is required"));
    }

    impl_->config = config;
    auto first = impl_->openConnection();
    if (!first) {
        return GameResult<void>::err(first.error());
    }
    impl_->slots.push_back(std::move(first).value());
    impl_->connected.store(true);
    return GameResult<void>::ok();
}

void GameDatabase::disconnect() {
    std::lock_guard lock(impl_->mutex);
    impl_->connected.store(false);
    for (auto& slot : impl_->slots) {
        (void)slot.manager->disconnect_result();
    }
    impl_->slots.clear();
    impl_->released.notify_all();
}

bool GameDatabase::isConnected() const noexcept {
    return impl_->connected.load();
}

GameResult<QueryResult> GameDatabase::query(std::string_view sql) {
    auto lease = impl_->lease();
    if (!lease) {
        return GameResult<QueryResult>::err(lease.error());
    }
    return runQuery(*lease.value(), sql);
}

GameResult<void> GameDatabase::execute(std::string_view sql) {
    auto lease = impl_->lease();
    if (!lease) {
        return GameResult<void>::err(lease.error());
    }
    return runCommand(*lease.value(), sql);
}

GameResult<Transaction> GameDatabase::beginTransaction() {
    auto lease = impl_->lease();
    if (!lease) {
        return GameResult<Transaction>::err(lease.error());
    }

    auto begun = (*lease.value()).begin_transaction();
    if (!begun.is_ok()) {
        return GameResult<Transaction>::err(GameError(
            ErrorCode::TransactionFailed, "cannot begin transaction: " + begun.error().message));
    }

    auto impl = std::make_unique<Transaction::Impl>();
    impl->lease = std::move(lease).value();
    return GameResult<Transaction>::ok(Transaction(std::move(impl)));
}

std::size_t GameDatabase::leasedConnections() const {
    std::lock_guard lock(impl_->mutex);
    std::size_t count = 0;
    for (const auto& slot : impl_->slots) {
        count += slot.leased ? 1 : 0;
    }
    return count;
}

} // namespace fxp::foundation
