/**
 * @file statement_adapter.hpp
 * @brief The only path through which migration procedures touch the database
 *
 * Migrations are hand-authored scripts. They hand the adapter either a
 * literal SQL string or a structured SqlFragment (a tree of text chunks,
 * bound values and nested fragments). The adapter flattens fragments
 * depth-first into a single SQL string, inlining values as SQL literals,
 * and sends the result to the connection.
 *
 *   adapter.execute("CREATE TABLE stocks (ts_code TEXT PRIMARY KEY)");
 *
 *   adapter.execute(sql("CREATE TABLE batch_table_", SqlFragment::raw("3"),
 *                       " (id INTEGER PRIMARY KEY)"));
 *
 *   adapter.execute(sql("INSERT INTO stocks (ts_code, name) VALUES (")
 *                       .param(std::string("000001.SZ")).append(", ")
 *                       .param(std::string("Ping An")).append(")"));
 *
 * Strings passed to sql() are SQL text and are inlined verbatim. Values
 * go through param() so they are rendered as quoted literals.
 */

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <variant>
#include <vector>
#include "connection.hpp"
#include "statement.hpp"

namespace stockdb {

/**
 * @brief Structured query: an ordered tree of SQL chunks
 */
class SqlFragment {
public:
    struct Param {
        Value value;
    };

    using Nested = std::shared_ptr<const SqlFragment>;
    using Chunk = std::variant<std::string, Param, Nested>;

    SqlFragment() = default;
    explicit SqlFragment(std::string text);

    /**
     * @brief Fragment holding verbatim SQL, for identifiers and keywords
     */
    static SqlFragment raw(std::string text);

    SqlFragment& append(std::string text);
    SqlFragment& param(Value value);
    SqlFragment& nest(SqlFragment fragment);
    SqlFragment& nest(Nested fragment);

    const std::vector<Chunk>& chunks() const { return chunks_; }
    bool empty() const { return chunks_.empty(); }

private:
    std::vector<Chunk> chunks_;
};

namespace detail {

inline void appendPart(SqlFragment& fragment, const char* text) {
    fragment.append(text);
}

inline void appendPart(SqlFragment& fragment, std::string text) {
    fragment.append(std::move(text));
}

inline void appendPart(SqlFragment& fragment, SqlFragment nested) {
    fragment.nest(std::move(nested));
}

inline void appendPart(SqlFragment& fragment, SqlFragment::Nested nested) {
    fragment.nest(std::move(nested));
}

inline void appendPart(SqlFragment& fragment, SqlFragment::Param param) {
    fragment.param(std::move(param.value));
}

} // namespace detail

/**
 * @brief Compose a fragment from text, nested fragments and SqlFragment::Param
 */
template<typename... Parts>
SqlFragment sql(Parts&&... parts) {
    SqlFragment fragment;
    (detail::appendPart(fragment, std::forward<Parts>(parts)), ...);
    return fragment;
}

/**
 * @brief Either literal SQL or a structured fragment
 */
using Query = std::variant<std::string, SqlFragment>;

class StatementAdapter {
public:
    static constexpr int kMaxNestingDepth = 64;

    explicit StatementAdapter(Connection& conn);
    virtual ~StatementAdapter() = default;

    StatementAdapter(const StatementAdapter&) = delete;
    StatementAdapter& operator=(const StatementAdapter&) = delete;

    /**
     * @brief Flatten and execute a query
     * @throws QueryFormatError if a fragment is malformed
     * @throws MigrationTimeout once cancel() has been called
     * @throws QueryException / ConstraintException from the driver
     */
    void execute(const Query& query);

    /**
     * @brief Flatten a fragment depth-first into one SQL string
     * @throws QueryFormatError on null nested fragments, non-finite numbers
     *         or nesting deeper than kMaxNestingDepth
     */
    static std::string flatten(const SqlFragment& fragment);

    static std::string toSql(const Query& query);

    /**
     * @brief Render a value as an inline SQL literal
     */
    static std::string literal(const Value& value);

    /**
     * @brief Make every later execute() fail; used when a procedure times out
     */
    void cancel() noexcept { cancelled_ = true; }
    void resetCancellation() noexcept { cancelled_ = false; }
    bool cancelled() const noexcept { return cancelled_; }

    Connection& connection() { return conn_; }

protected:
    /**
     * @brief The underlying execution primitive
     */
    virtual void send(const std::string& sql);

private:
    static void flattenInto(const SqlFragment& fragment, std::string& out, int depth);

    Connection& conn_;
    std::atomic<bool> cancelled_{false};
};

} // namespace stockdb
