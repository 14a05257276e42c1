/*
 * observable_ring_buffer_test.cpp
 *
 * Change-stream test for ringview::observable_ring_buffer and ringview::event.
 *
 * Goals:
 *  - Every mutation raises exactly one event per structural change, with the
 *    documented shape (action, single/batch, items, indices).
 *  - Bad indices throw before anything changes or is raised.
 *  - Fixed-size mode evicts the opposite end with its own remove event.
 *  - event<>: tokens, idempotent unsubscribe, self-unsubscribe while raising,
 *    exceptions reaching the raiser.
 */

#include <QtTest/QtTest>

#include <stdexcept>
#include <string>
#include <vector>

#include "observable_ring_buffer_test.h"
#include "observable_ring_buffer.hpp"

namespace {

using ringview::collection_changed_action;

using source_t = ringview::observable_ring_buffer<int>;
using change_t = source_t::change_type;

static constexpr reg npos = change_t::npos;

// Owning copy of one delivered event.
struct Recorded final {
    collection_changed_action action{collection_changed_action::reset};
    bool single{false};
    std::vector<int> new_items;
    std::vector<int> old_items;
    reg new_index{npos};
    reg old_index{npos};
};

class Recorder final {
public:
    explicit Recorder(source_t& src)
        : src_(src)
        , token_(src.collection_changed().subscribe([this](const change_t& e) { record(e); }))
    {}

    ~Recorder() { (void)src_.collection_changed().unsubscribe(token_); }

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    const std::vector<Recorded>& events() const noexcept { return events_; }
    void clear() { events_.clear(); }

private:
    void record(const change_t& e) {
        Recorded r;
        r.action = e.action;
        r.single = e.is_single_item;
        r.new_items.assign(e.new_items.begin(), e.new_items.end());
        r.old_items.assign(e.old_items.begin(), e.old_items.end());
        r.new_index = e.new_starting_index;
        r.old_index = e.old_starting_index;
        if (e.is_single_item && e.new_item != nullptr) {
            QCOMPARE(*e.new_item, r.new_items.front());
        }
        if (e.is_single_item && e.old_item != nullptr) {
            QCOMPARE(*e.old_item, r.old_items.front());
        }
        events_.push_back(std::move(r));
    }

    source_t& src_;
    source_t::event_type::token_type token_;
    std::vector<Recorded> events_;
};

template<class F>
static bool throws_out_of_range(F&& f)
{
    try {
        f();
    } catch (const std::out_of_range&) {
        return true;
    }
    return false;
}

static void expect_event(const Recorded& r, collection_changed_action action, bool single,
                         const std::vector<int>& new_items, reg new_index,
                         const std::vector<int>& old_items, reg old_index)
{
    QCOMPARE(r.action, action);
    QCOMPARE(r.single, single);
    QCOMPARE(r.new_items, new_items);
    QCOMPARE(r.new_index, new_index);
    QCOMPARE(r.old_items, old_items);
    QCOMPARE(r.old_index, old_index);
}

// ------------------------------ suites ------------------------------

static void add_suite()
{
    source_t src;
    Recorder rec(src);

    src.add_last(1);
    src.add_last(2);
    src.add_first(0);
    src.add_last_range({3, 4, 5});
    src.add_last_range(std::vector<int>{});

    QCOMPARE(src.to_vector(), (std::vector<int>{0, 1, 2, 3, 4, 5}));
    QCOMPARE(rec.events().size(), std::size_t{4u});

    const auto add = collection_changed_action::add;
    expect_event(rec.events()[0], add, true, {1}, 0u, {}, npos);
    expect_event(rec.events()[1], add, true, {2}, 1u, {}, npos);
    expect_event(rec.events()[2], add, true, {0}, 0u, {}, npos);
    expect_event(rec.events()[3], add, false, {3, 4, 5}, 3u, {}, npos);
}

static void remove_suite()
{
    source_t src{0, 1, 2, 3, 4, 5, 6, 7, 8, 9};
    Recorder rec(src);

    QCOMPARE(src.remove_first(), 0);
    QCOMPARE(src.remove_last(), 9);
    QCOMPARE(src.remove_at(3u), 4);
    src.remove_range(1u, 3u);
    src.remove_range(0u, 0u);

    QCOMPARE(src.to_vector(), (std::vector<int>{1, 6, 7, 8}));
    QCOMPARE(rec.events().size(), std::size_t{4u});

    const auto remove = collection_changed_action::remove;
    expect_event(rec.events()[0], remove, true, {}, npos, {0}, 0u);
    expect_event(rec.events()[1], remove, true, {}, npos, {9}, 8u);
    expect_event(rec.events()[2], remove, true, {}, npos, {4}, 3u);
    expect_event(rec.events()[3], remove, false, {}, npos, {2, 3, 5}, 1u);
}

static void replace_move_reset_suite()
{
    source_t src{10, 11, 12, 13};
    Recorder rec(src);

    QCOMPARE(src.set(2u, 42), 12);
    src.move(0u, 3u);
    QCOMPARE(src.to_vector(), (std::vector<int>{11, 42, 13, 10}));
    QCOMPARE(src.index_of(13), reg{2u});
    QCOMPARE(src.index_of(99), source_t::npos);
    QCOMPARE(src.at(1u), 42);

    src.clear();
    QCOMPARE(src.count(), reg{0u});
    QVERIFY(src.empty());

    QCOMPARE(rec.events().size(), std::size_t{3u});
    expect_event(rec.events()[0], collection_changed_action::replace, true, {42}, 2u, {12}, 2u);
    expect_event(rec.events()[1], collection_changed_action::move, true, {10}, 3u, {10}, 0u);
    expect_event(rec.events()[2], collection_changed_action::reset, false, {}, npos, {}, npos);

    QCOMPARE(QString::fromLatin1(ringview::action_name(collection_changed_action::move)),
             QStringLiteral("move"));
}

static void bad_index_suite()
{
    source_t src{1, 2, 3};
    Recorder rec(src);

    QVERIFY(throws_out_of_range([&] { (void)src.at(3u); }));
    QVERIFY(throws_out_of_range([&] { (void)src.set(3u, 0); }));
    QVERIFY(throws_out_of_range([&] { (void)src.remove_at(3u); }));
    QVERIFY(throws_out_of_range([&] { src.remove_range(2u, 2u); }));
    QVERIFY(throws_out_of_range([&] { src.move(0u, 3u); }));

    source_t empty;
    Recorder empty_rec(empty);
    QVERIFY(throws_out_of_range([&] { (void)empty.remove_first(); }));
    QVERIFY(throws_out_of_range([&] { (void)empty.remove_last(); }));

    QCOMPARE(src.to_vector(), (std::vector<int>{1, 2, 3}));
    QVERIFY(rec.events().empty());
    QVERIFY(empty_rec.events().empty());
}

static void fixed_size_suite()
{
    source_t src(3u, true);
    QVERIFY(src.is_fixed_size());
    QCOMPARE(src.max_count(), reg{3u});
    Recorder rec(src);

    const auto add = collection_changed_action::add;
    const auto remove = collection_changed_action::remove;

    src.add_last(1);
    src.add_last(2);
    src.add_last(3);
    rec.clear();

    src.add_last(4);
    QCOMPARE(src.to_vector(), (std::vector<int>{2, 3, 4}));
    QCOMPARE(rec.events().size(), std::size_t{2u});
    expect_event(rec.events()[0], remove, true, {}, npos, {1}, 0u);
    expect_event(rec.events()[1], add, true, {4}, 2u, {}, npos);
    rec.clear();

    src.add_first(0);
    QCOMPARE(src.to_vector(), (std::vector<int>{0, 2, 3}));
    QCOMPARE(rec.events().size(), std::size_t{2u});
    expect_event(rec.events()[0], remove, true, {}, npos, {4}, 2u);
    expect_event(rec.events()[1], add, true, {0}, 0u, {}, npos);
    rec.clear();

    src.add_last_range({5, 6});
    QCOMPARE(src.to_vector(), (std::vector<int>{3, 5, 6}));
    QCOMPARE(rec.events().size(), std::size_t{2u});
    expect_event(rec.events()[0], remove, false, {}, npos, {0, 2}, 0u);
    expect_event(rec.events()[1], add, false, {5, 6}, 1u, {}, npos);
    rec.clear();

    // Longer than the limit: only the tail of the range is kept.
    src.add_last_range({7, 8, 9, 10});
    QCOMPARE(src.to_vector(), (std::vector<int>{8, 9, 10}));
    QCOMPARE(rec.events().size(), std::size_t{2u});
    expect_event(rec.events()[0], remove, false, {}, npos, {3, 5, 6}, 0u);
    expect_event(rec.events()[1], add, false, {8, 9, 10}, 0u, {}, npos);

    bool threw = false;
    try {
        source_t bad(0u, true);
        Q_UNUSED(bad);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    QVERIFY(threw);

    // Not fixed-size: capacity is only a hint.
    source_t hinted(2u);
    QVERIFY(!hinted.is_fixed_size());
    hinted.add_last_range({1, 2, 3, 4});
    QCOMPARE(hinted.count(), reg{4u});
}

static void subscriber_failure_suite()
{
    source_t src{1};
    const auto token = src.collection_changed().subscribe([](const change_t&) {
        throw std::runtime_error("subscriber failed");
    });

    bool threw = false;
    try {
        src.add_last(2);
    } catch (const std::runtime_error&) {
        threw = true;
    }
    QVERIFY(threw);
    // No rollback: the mutation itself was applied.
    QCOMPARE(src.to_vector(), (std::vector<int>{1, 2}));

    QVERIFY(src.collection_changed().unsubscribe(token));
    src.add_last(3);
    QCOMPARE(src.count(), reg{3u});
}

static void event_suite()
{
    ringview::event<int> ev;
    QVERIFY(ev.empty());

    std::vector<std::string> calls;
    const auto a = ev.subscribe([&](int v) { calls.push_back("a" + std::to_string(v)); });
    const auto b = ev.subscribe([&](int v) { calls.push_back("b" + std::to_string(v)); });
    QVERIFY(a != ringview::event<int>::invalid_token);
    QVERIFY(b != ringview::event<int>::invalid_token);
    QVERIFY(a != b);
    QCOMPARE(ev.subscriber_count(), reg{2u});

    const auto none = ev.subscribe({});
    QCOMPARE(none, ringview::event<int>::invalid_token);
    QCOMPARE(ev.subscriber_count(), reg{2u});

    ev.raise(1);
    QCOMPARE(calls, (std::vector<std::string>{"a1", "b1"}));

    QVERIFY(ev.unsubscribe(a));
    QVERIFY(!ev.unsubscribe(a));
    QVERIFY(!ev.unsubscribe(ringview::event<int>::invalid_token));
    calls.clear();
    ev.raise(2);
    QCOMPARE(calls, (std::vector<std::string>{"b2"}));

    // A handler removing itself mid-raise: the current raise still completes.
    ringview::event<int>::token_type self = ringview::event<int>::invalid_token;
    self = ev.subscribe([&](int v) {
        calls.push_back("self" + std::to_string(v));
        (void)ev.unsubscribe(self);
    });
    const auto c = ev.subscribe([&](int v) { calls.push_back("c" + std::to_string(v)); });
    calls.clear();
    ev.raise(3);
    QCOMPARE(calls, (std::vector<std::string>{"b3", "self3", "c3"}));
    calls.clear();
    ev.raise(4);
    QCOMPARE(calls, (std::vector<std::string>{"b4", "c4"}));

    // Removing a later handler mid-raise skips it in that raise; a handler
    // added mid-raise is first called by the next one.
    using token_t = ringview::event<int>::token_type;
    QVERIFY(ev.unsubscribe(c));
    token_t d = ringview::event<int>::invalid_token;
    token_t late = ringview::event<int>::invalid_token;
    const auto cutter = ev.subscribe([&](int v) {
        calls.push_back("cut" + std::to_string(v));
        if (ev.unsubscribe(d)) {
            late = ev.subscribe([&](int w) { calls.push_back("late" + std::to_string(w)); });
        }
    });
    d = ev.subscribe([&](int v) { calls.push_back("d" + std::to_string(v)); });
    calls.clear();
    ev.raise(5);
    QCOMPARE(calls, (std::vector<std::string>{"b5", "cut5"}));
    calls.clear();
    ev.raise(6);
    QCOMPARE(calls, (std::vector<std::string>{"b6", "cut6", "late6"}));

    QVERIFY(ev.unsubscribe(b));
    QVERIFY(ev.unsubscribe(cutter));
    QVERIFY(ev.unsubscribe(late));
    QVERIFY(ev.empty());
    calls.clear();
    ev.raise(7);
    QVERIFY(calls.empty());
}

} // namespace

class tst_observable_ring_buffer final : public QObject {
    Q_OBJECT
private slots:
    void add_events()               { add_suite(); }
    void remove_events()            { remove_suite(); }
    void replace_move_reset_events() { replace_move_reset_suite(); }
    void bad_index_raises_nothing() { bad_index_suite(); }
    void fixed_size_eviction()      { fixed_size_suite(); }
    void subscriber_failure()       { subscriber_failure_suite(); }
    void event_subscription()       { event_suite(); }
};

// ------------------------------ runner (no main here) ------------------------------
int run_tst_observable_ring_buffer(int argc, char** argv)
{
    tst_observable_ring_buffer tc;
    return QTest::qExec(&tc, argc, argv);
}

#include "observable_ring_buffer_test.moc"
