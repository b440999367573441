// source_test.cpp
// API/contract tests for the chunkiter source protocol and the stock sources.
//
// Goals:
//  - Capability traits detect exactly what each source offers.
//  - Sources are single-pass and destructive (items are never replayed).
//  - Size reporting stays exact while items are consumed.
//  - stream_source tells a clean end of input from a malformed one.

#include <QtTest/QtTest>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <forward_list>
#include <iterator>
#include <limits>
#include <list>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#if !defined(CHUNKITER_ASSERT) && !defined(NDEBUG)
#  define CHUNKITER_ASSERT(expr) do { if(!(expr)) { std::abort(); } } while(0)
#endif

#include "source.hpp"

namespace {

struct Counter {
    std::uint32_t next_value{0};
    std::uint32_t limit{0};
    std::uint32_t* calls{nullptr};

    std::optional<std::uint32_t> operator()() {
        if (calls) { ++*calls; }
        if (next_value >= limit) {
            return std::nullopt;
        }
        return next_value++;
    }
};

// Minimal hand-written source: protocol only, no capabilities.
struct BareSource {
    using value_type = int;
    int n{0};
    std::optional<int> next() {
        if (n == 0) { return std::nullopt; }
        return n--;
    }
};

struct NotASource {
    using value_type = int;
    int next() { return 0; }
};

static void traits_compile() {
    using VecIt   = std::vector<int>::iterator;
    using ListIt  = std::list<int>::iterator;
    using VecSrc  = chunkiter::iterator_source<VecIt>;
    using ListSrc = chunkiter::iterator_source<ListIt>;
    using OwnSrc  = chunkiter::container_source<std::vector<std::string>>;
    using GenSrc  = chunkiter::generator_source<Counter>;
    using StrSrc  = chunkiter::stream_source<int>;

    static_assert(chunkiter::is_source_v<VecSrc>);
    static_assert(chunkiter::is_source_v<ListSrc>);
    static_assert(chunkiter::is_source_v<OwnSrc>);
    static_assert(chunkiter::is_source_v<GenSrc>);
    static_assert(chunkiter::is_source_v<StrSrc>);
    static_assert(chunkiter::is_source_v<BareSource>);
    static_assert(!chunkiter::is_source_v<NotASource>);
    static_assert(!chunkiter::is_source_v<int>);
    static_assert(!chunkiter::is_source_v<std::vector<int>>);

    static_assert(chunkiter::has_size_hint_v<VecSrc>);
    static_assert(chunkiter::has_exact_size_v<VecSrc>);
    static_assert(chunkiter::has_size_hint_v<ListSrc>);
    static_assert(!chunkiter::has_exact_size_v<ListSrc>);
    static_assert(chunkiter::has_exact_size_v<OwnSrc>);
    static_assert(!chunkiter::has_size_hint_v<GenSrc>);
    static_assert(!chunkiter::has_exact_size_v<GenSrc>);
    static_assert(!chunkiter::has_size_hint_v<BareSource>);

    static_assert(chunkiter::has_failed_v<StrSrc>);
    static_assert(!chunkiter::has_failed_v<VecSrc>);
    static_assert(!chunkiter::has_failed_v<GenSrc>);

    using FwdSrc = chunkiter::container_source<std::forward_list<int>>;
    static_assert(chunkiter::is_source_v<FwdSrc>);
    static_assert(!chunkiter::has_size_hint_v<FwdSrc>);
    static_assert(!chunkiter::has_exact_size_v<FwdSrc>);

    static_assert(std::is_nothrow_move_constructible_v<OwnSrc>);
    static_assert(std::is_nothrow_move_constructible_v<FwdSrc>);

    static_assert(std::is_same_v<VecSrc::value_type, int>);
    static_assert(std::is_same_v<OwnSrc::value_type, std::string>);
    static_assert(std::is_same_v<GenSrc::value_type, std::uint32_t>);
    static_assert(std::is_same_v<chunkiter::iterator_source<const int*>::value_type, int>);
}

static void size_bounds_suite() {
    using chunkiter::size_bounds;

    const size_bounds e = size_bounds::exact(7u);
    QVERIFY(e.is_exact());
    QCOMPARE(e.lower, reg{7u});
    QVERIFY(e.upper.has_value());

    const size_bounds u = size_bounds::unknown();
    QVERIFY(!u.is_exact());
    QCOMPARE(u.lower, reg{0u});
    QVERIFY(!u.upper.has_value());

    // Floor division on both ends.
    QVERIFY(e.divided_by(3u) == size_bounds::exact(2u));
    QVERIFY(e.divided_by(7u) == size_bounds::exact(1u));
    QVERIFY(e.divided_by(8u) == size_bounds::exact(0u));
    QVERIFY((size_bounds{5u, 11u}.divided_by(2u) == size_bounds{2u, 5u}));
    QVERIFY((size_bounds{4u, std::nullopt}.divided_by(3u) == size_bounds{1u, std::nullopt}));

    // Division by zero reports "unbounded".
    const size_bounds z = e.divided_by(0u);
    QCOMPARE(z.lower, std::numeric_limits<reg>::max());
    QVERIFY(!z.upper.has_value());

    QVERIFY(e != u);
}

static void iterator_source_random_access_suite() {
    std::vector<int> v{10, 20, 30, 40, 50};
    chunkiter::iterator_source<std::vector<int>::iterator> s(v.begin(), v.end());

    QCOMPARE(s.exact_size(), reg{5u});
    QVERIFY(s.size_hint() == chunkiter::size_bounds::exact(5u));

    for (int i = 0; i < 5; ++i) {
        const std::optional<int> item = s.next();
        QVERIFY(item.has_value());
        QCOMPARE(*item, (i + 1) * 10);
        QCOMPARE(s.exact_size(), reg(4 - i));
    }
    QVERIFY(!s.next().has_value());
    QVERIFY(!s.next().has_value());
    QCOMPARE(s.exact_size(), reg{0u});

    // Copy semantics: the underlying range is untouched.
    QCOMPARE(v[0], 10);
    QCOMPARE(v[4], 50);
}

static void iterator_source_bidirectional_suite() {
    std::list<int> l{1, 2, 3};
    chunkiter::iterator_source<std::list<int>::const_iterator> s(l.cbegin(), l.cend());

    QVERIFY(s.size_hint() == chunkiter::size_bounds::unknown());
    QCOMPARE(*s.next(), 1);
    QCOMPARE(*s.next(), 2);
    QCOMPARE(*s.next(), 3);
    QVERIFY(!s.next());
}

static void iterator_source_move_iterator_suite() {
    std::vector<std::unique_ptr<int>> v;
    v.push_back(std::make_unique<int>(1));
    v.push_back(std::make_unique<int>(2));

    using It = std::move_iterator<std::vector<std::unique_ptr<int>>::iterator>;
    chunkiter::iterator_source<It> s(It(v.begin()), It(v.end()));

    std::optional<std::unique_ptr<int>> a = s.next();
    QVERIFY(a.has_value());
    QCOMPARE(**a, 1);
    QVERIFY(v[0] == nullptr); // moved out
    QVERIFY(v[1] != nullptr);
    QCOMPARE(s.exact_size(), reg{1u});
}

static void container_source_suite() {
    chunkiter::container_source<std::vector<std::string>> s(
        std::vector<std::string>{"a", "bb", "ccc", "dddd"});

    QCOMPARE(s.exact_size(), reg{4u});
    QVERIFY(*s.next() == "a");
    QVERIFY(*s.next() == "bb");
    QCOMPARE(s.exact_size(), reg{2u});

    // Moving the source mid-way keeps the cursor on the same element.
    chunkiter::container_source<std::vector<std::string>> moved(std::move(s));
    QCOMPARE(moved.exact_size(), reg{2u});
    QVERIFY(*moved.next() == "ccc");
    QVERIFY(*moved.next() == "dddd");
    QVERIFY(!moved.next());
    QCOMPARE(moved.exact_size(), reg{0u});
}

static void container_source_node_based_suite() {
    chunkiter::container_source<std::list<std::unique_ptr<int>>> s([] {
        std::list<std::unique_ptr<int>> l;
        for (int i = 0; i < 4; ++i) {
            l.push_back(std::make_unique<int>(i));
        }
        return l;
    }());

    QCOMPARE(**s.next(), 0);
    chunkiter::container_source<std::list<std::unique_ptr<int>>> moved(std::move(s));
    QCOMPARE(**moved.next(), 1);
    QCOMPARE(**moved.next(), 2);
    QCOMPARE(moved.exact_size(), reg{1u});
    QCOMPARE(**moved.next(), 3);
    QVERIFY(!moved.next());

    // std::array lives inline: the moved-to source must not point back into
    // the moved-from one.
    chunkiter::container_source<std::array<int, 3>> a(std::array<int, 3>{7, 8, 9});
    QCOMPARE(*a.next(), 7);
    chunkiter::container_source<std::array<int, 3>> b(std::move(a));
    QCOMPARE(*b.next(), 8);
    QCOMPARE(*b.next(), 9);
    QVERIFY(!b.next());
}

static void container_source_unsized_suite() {
    chunkiter::container_source<std::forward_list<std::string>> s(
        std::forward_list<std::string>{"x", "y", "z"});
    QVERIFY(*s.next() == "x");

    chunkiter::container_source<std::forward_list<std::string>> moved(std::move(s));
    QVERIFY(*moved.next() == "y");
    QVERIFY(*moved.next() == "z");
    QVERIFY(!moved.next());
}

static void generator_source_suite() {
    std::uint32_t calls = 0;
    chunkiter::generator_source<Counter> s(Counter{0u, 3u, &calls});

    QCOMPARE(*s.next(), 0u);
    QCOMPARE(*s.next(), 1u);
    QCOMPARE(*s.next(), 2u);
    QVERIFY(!s.next());
    QCOMPARE(calls, 4u);

    // Lambdas work as generators too.
    int n = 0;
    auto fn = [&n]() -> std::optional<int> {
        if (n >= 2) { return std::nullopt; }
        return n++;
    };
    chunkiter::generator_source<decltype(fn)> g(fn);
    QCOMPARE(*g.next(), 0);
    QCOMPARE(*g.next(), 1);
    QVERIFY(!g.next());
}

static void stream_source_clean_end_suite() {
    {
        std::istringstream in("1 2 3");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), 1);
        QCOMPARE(*s.next(), 2);
        QCOMPARE(*s.next(), 3);
        QVERIFY(!s.stopped());
        QVERIFY(!s.next());
        QVERIFY(s.stopped());
        QVERIFY(!s.failed());
        QCOMPARE(s.items_read(), reg{3u});
    }
    {
        // Trailing whitespace is still a clean end.
        std::istringstream in("4\n5\n\n");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), 4);
        QCOMPARE(*s.next(), 5);
        QVERIFY(!s.next());
        QVERIFY(!s.failed());
    }
    {
        std::istringstream in("");
        chunkiter::stream_source<int> s(in);
        QVERIFY(!s.next());
        QVERIFY(!s.failed());
        QCOMPARE(s.items_read(), reg{0u});
    }
    {
        std::istringstream in("alpha beta");
        chunkiter::stream_source<std::string> s(in);
        QVERIFY(*s.next() == "alpha");
        QVERIFY(*s.next() == "beta");
        QVERIFY(!s.next());
        QVERIFY(!s.failed());
    }
}

static void stream_source_failure_suite() {
    std::istringstream in("1 2 x 4");
    chunkiter::stream_source<int> s(in);
    QCOMPARE(*s.next(), 1);
    QCOMPARE(*s.next(), 2);
    QVERIFY(!s.next());
    QVERIFY(s.failed());
    QVERIFY(s.stopped());

    // Stopped for good: "4" is never read even though it is well-formed.
    QVERIFY(!s.next());
    QCOMPARE(s.items_read(), reg{2u});
}

static void stream_source_trailing_malformed_suite() {
    {
        // Last token cut short by end of stream.
        std::istringstream in("1 2 -");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), 1);
        QCOMPARE(*s.next(), 2);
        QVERIFY(!s.next());
        QVERIFY(s.stopped());
        QVERIFY(s.failed());
        QCOMPARE(s.items_read(), reg{2u});
    }
    {
        std::istringstream in("1 2 x");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), 1);
        QCOMPARE(*s.next(), 2);
        QVERIFY(!s.next());
        QVERIFY(s.failed());
    }
    {
        // Garbage glued to the last number.
        std::istringstream in("7 8z");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), 7);
        QCOMPARE(*s.next(), 8);
        QVERIFY(!s.next());
        QVERIFY(s.failed());
    }
    {
        // Signed value, then only whitespace: clean end.
        std::istringstream in("-3 \t\n");
        chunkiter::stream_source<int> s(in);
        QCOMPARE(*s.next(), -3);
        QVERIFY(!s.next());
        QVERIFY(!s.failed());
    }
}

class tst_source_api final : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        traits_compile();
    }

    void size_bounds_contract() { size_bounds_suite(); }
    void iterator_source_random_access() { iterator_source_random_access_suite(); }
    void iterator_source_bidirectional() { iterator_source_bidirectional_suite(); }
    void iterator_source_move_iterator() { iterator_source_move_iterator_suite(); }
    void container_source_contract() { container_source_suite(); }
    void container_source_node_based() { container_source_node_based_suite(); }
    void container_source_unsized() { container_source_unsized_suite(); }
    void generator_source_contract() { generator_source_suite(); }
    void stream_source_clean_end() { stream_source_clean_end_suite(); }
    void stream_source_failure() { stream_source_failure_suite(); }
    void stream_source_trailing_malformed() { stream_source_trailing_malformed_suite(); }
};

} // namespace

int run_tst_source_api(int argc, char** argv) {
    tst_source_api tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "source_test.moc"
