#include <boost/test/unit_test.hpp>
#include <boost/mpl/list.hpp>

#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "tesim/genome.hpp"
#include "tesim/statistics.hpp"

using namespace tesim;

using genome_types = boost::mpl::list<ListGenome, LinkedListGenome>;

namespace {

// Indices where the rendering shows an active cell.
std::vector<Position> active_cells(const std::string& s) {
    std::vector<Position> out;
    for (std::size_t i = 0; i < s.size(); ++i)
        if (s[i] == 'A') out.push_back(static_cast<Position>(i));
    return out;
}

template <typename G>
void require_consistent(const G& g) {
    const auto problems = check_invariants(g);
    for (const auto& p : problems) BOOST_TEST_MESSAGE(p);
    BOOST_REQUIRE(problems.empty());
}

}  // namespace

BOOST_AUTO_TEST_SUITE(GenomeTests)

BOOST_AUTO_TEST_CASE_TEMPLATE(newGenomeIsEmpty, G, genome_types) {
    G g(10);
    BOOST_CHECK_EQUAL(g.length(), 10);
    BOOST_CHECK_EQUAL(g.render(), "----------");
    BOOST_CHECK(g.active_tes().empty());
    BOOST_CHECK_EQUAL(g.ids_issued(), kNoTE);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(insertShiftsLaterTEs, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(5, 3);
    BOOST_CHECK_EQUAL(id1, 1u);
    BOOST_CHECK_EQUAL(g.length(), 13);
    BOOST_CHECK(*g.range_of(id1) == (TERange{5, 8}));
    BOOST_CHECK((active_cells(g.render()) == std::vector<Position>{5, 6, 7}));

    const TEID id2 = g.insert_te(2, 2);
    BOOST_CHECK_EQUAL(id2, 2u);
    BOOST_CHECK_EQUAL(g.length(), 15);
    BOOST_CHECK(*g.range_of(id1) == (TERange{7, 10}));
    BOOST_CHECK(*g.range_of(id2) == (TERange{2, 4}));
    BOOST_CHECK_EQUAL(g.render(), "--AA---AAA-----");
    BOOST_CHECK((g.active_tes() == std::vector<TEID>{id1, id2}));
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(insertShiftsOnlyTEsAfterPoint, G, genome_types) {
    G g(20);
    const TEID a = g.insert_te(10, 2);
    const TEID b = g.insert_te(15, 1);
    BOOST_CHECK(*g.range_of(a) == (TERange{10, 12}));
    BOOST_CHECK(*g.range_of(b) == (TERange{15, 16}));

    const TEID c = g.insert_te(5, 3);
    BOOST_CHECK(*g.range_of(a) == (TERange{13, 15}));
    BOOST_CHECK(*g.range_of(b) == (TERange{18, 19}));
    BOOST_CHECK(*g.range_of(c) == (TERange{5, 8}));
    BOOST_CHECK_EQUAL(g.length(), 26);
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(collisionDisablesWholeTE, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(2, 4);
    BOOST_CHECK_EQUAL(g.render(), "--AAAA--------");

    const TEID id2 = g.insert_te(4, 2);
    BOOST_CHECK(!g.is_active(id1));
    BOOST_CHECK((g.active_tes() == std::vector<TEID>{id2}));
    BOOST_CHECK_EQUAL(g.render(), "--xxAAxx--------");
    BOOST_CHECK(*g.range_of(id2) == (TERange{4, 6}));
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(insertAtStartOfTECollides, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(3, 2);
    const TEID id2 = g.insert_te(3, 1);
    BOOST_CHECK(!g.is_active(id1));
    BOOST_CHECK(g.is_active(id2));
    BOOST_CHECK_EQUAL(g.render(), "---Axx-----");
}

BOOST_AUTO_TEST_CASE_TEMPLATE(insertAtEndOfTEDoesNotCollide, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(3, 2);
    const TEID id2 = g.insert_te(5, 1);
    BOOST_CHECK(*g.range_of(id1) == (TERange{3, 5}));
    BOOST_CHECK(*g.range_of(id2) == (TERange{5, 6}));
    BOOST_CHECK_EQUAL(g.render(), "---AAA-----");
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(positionEqualToLengthWrapsToZero, G, genome_types) {
    G g(5);
    const TEID id1 = g.insert_te(5, 2);
    BOOST_CHECK(*g.range_of(id1) == (TERange{0, 2}));
    BOOST_CHECK_EQUAL(g.render(), "AA-----");

    // The wrapped point lands on id1's first cell.
    const TEID id2 = g.insert_te(g.length(), 1);
    BOOST_CHECK(!g.is_active(id1));
    BOOST_CHECK(*g.range_of(id2) == (TERange{0, 1}));
    BOOST_CHECK_EQUAL(g.render(), "Axx-----");
}

BOOST_AUTO_TEST_CASE_TEMPLATE(emptyGenomeAcceptsInsertAtZero, G, genome_types) {
    G g(0);
    BOOST_CHECK_THROW(g.insert_te(1, 1), std::out_of_range);
    const TEID id = g.insert_te(0, 3);
    BOOST_CHECK_EQUAL(g.render(), "AAA");
    BOOST_CHECK(*g.range_of(id) == (TERange{0, 3}));
}

BOOST_AUTO_TEST_CASE_TEMPLATE(badInsertLeavesGenomeUntouched, G, genome_types) {
    G g(10);
    (void)g.insert_te(4, 2);
    const std::string before = g.render();

    BOOST_CHECK_THROW(g.insert_te(13, 1), std::out_of_range);
    BOOST_CHECK_THROW(g.insert_te(-1, 1), std::out_of_range);
    BOOST_CHECK_THROW(g.insert_te(3, 0), std::invalid_argument);
    BOOST_CHECK_THROW(g.insert_te(3, -2), std::invalid_argument);
    BOOST_CHECK_THROW(g.insert_te(3, std::numeric_limits<Position>::max() - 5),
                      std::length_error);

    BOOST_CHECK_EQUAL(g.render(), before);
    BOOST_CHECK_EQUAL(g.length(), 12);
    BOOST_CHECK_EQUAL(g.ids_issued(), 1u);
    BOOST_CHECK_EQUAL(g.insert_te(12, 1), 2u);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(failedSpliceLeavesGenomeUntouched, G, genome_types) {
    G g(10);
    const TEID a = g.insert_te(2, 3);
    const TEID b = g.insert_te(8, 1);
    const std::string before = g.render();

    // The store cannot hold this many cells; the splice throws and the
    // colliding TE, the shifted TE and the id counter must all survive.
    BOOST_CHECK_THROW(g.insert_te(3, Position{1} << 61), std::exception);

    BOOST_CHECK_EQUAL(g.render(), before);
    BOOST_CHECK_EQUAL(g.length(), 14);
    BOOST_CHECK_EQUAL(g.ids_issued(), 2u);
    BOOST_CHECK(*g.range_of(a) == (TERange{2, 5}));
    BOOST_CHECK(*g.range_of(b) == (TERange{8, 9}));
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(collisionInsideTEMarksBothHalves, G, genome_types) {
    G g(6);
    const TEID a = g.insert_te(1, 4);           // -AAAA-----
    (void)g.insert_te(3, 2);                     // -xxAAxx-----
    BOOST_CHECK(!g.is_active(a));
    BOOST_CHECK_EQUAL(g.render(), "-xxAAxx-----");
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(copyWrapsBelowZero, G, genome_types) {
    G g(8);
    const TEID id1 = g.insert_te(1, 2);
    BOOST_REQUIRE_EQUAL(g.length(), 10);

    const auto id2 = g.copy_te(id1, -5);
    BOOST_REQUIRE(id2.has_value());
    BOOST_CHECK_NE(*id2, id1);
    BOOST_CHECK(*g.range_of(*id2) == (TERange{6, 8}));
    BOOST_CHECK(*g.range_of(id1) == (TERange{1, 3}));
    BOOST_CHECK_EQUAL(g.render(), "-AA---AA----");
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(copyWrapsPastEnd, G, genome_types) {
    G g(8);
    const TEID id1 = g.insert_te(1, 2);

    const auto id2 = g.copy_te(id1, 12);
    BOOST_REQUIRE(id2.has_value());
    BOOST_CHECK(*g.range_of(*id2) == (TERange{3, 5}));
    BOOST_CHECK_EQUAL(g.render(), "-AAAA-------");

    // Offsets of more than one full lap still land on the ring.
    const auto id3 = g.copy_te(id1, -25);
    BOOST_REQUIRE(id3.has_value());
    BOOST_CHECK(*g.range_of(*id3) == (TERange{0, 2}));
    require_consistent(g);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(copyOntoItselfDisablesSource, G, genome_types) {
    G g(8);
    const TEID id1 = g.insert_te(1, 2);
    const auto id2 = g.copy_te(id1, 0);
    BOOST_REQUIRE(id2.has_value());
    BOOST_CHECK(!g.is_active(id1));
    BOOST_CHECK_EQUAL(g.render(), "-AAxx-------");
    BOOST_CHECK((g.active_tes() == std::vector<TEID>{*id2}));
}

BOOST_AUTO_TEST_CASE_TEMPLATE(copyUsesCurrentPosition, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(5, 2);
    (void)g.insert_te(0, 3);
    BOOST_CHECK(*g.range_of(id1) == (TERange{8, 10}));

    const auto id3 = g.copy_te(id1, 2);
    BOOST_REQUIRE(id3.has_value());
    BOOST_CHECK(*g.range_of(*id3) == (TERange{10, 12}));
}

BOOST_AUTO_TEST_CASE_TEMPLATE(copyOfInactiveChangesNothing, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(2, 3);
    const TEID id2 = g.insert_te(8, 1);
    g.disable_te(id1);

    const std::string render = g.render();
    const Position len = g.length();
    const auto active = g.active_tes();

    BOOST_CHECK(!g.copy_te(id1, 3).has_value());
    BOOST_CHECK(!g.copy_te(999, -3).has_value());
    BOOST_CHECK(!g.copy_te(kNoTE, 0).has_value());

    BOOST_CHECK_EQUAL(g.render(), render);
    BOOST_CHECK_EQUAL(g.length(), len);
    BOOST_CHECK(g.active_tes() == active);
    BOOST_CHECK_EQUAL(g.ids_issued(), id2);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(disableIsIdempotent, G, genome_types) {
    G g(10);
    const TEID id = g.insert_te(2, 3);
    g.disable_te(id);
    const std::string once = g.render();
    BOOST_CHECK_EQUAL(once, "--xxx--------");
    BOOST_CHECK(g.active_tes().empty());

    g.disable_te(id);
    BOOST_CHECK_EQUAL(g.render(), once);

    g.disable_te(42);
    g.disable_te(kNoTE);
    BOOST_CHECK_EQUAL(g.render(), once);
    BOOST_CHECK_EQUAL(g.length(), 13);
}

BOOST_AUTO_TEST_CASE_TEMPLATE(idsAreNeverReused, G, genome_types) {
    G g(10);
    const TEID a = g.insert_te(1, 1);
    g.disable_te(a);
    const TEID b = g.insert_te(1, 1);
    BOOST_CHECK_EQUAL(a, 1u);
    BOOST_CHECK_EQUAL(b, 2u);
    BOOST_CHECK(!g.copy_te(a, 1).has_value());
}

BOOST_AUTO_TEST_CASE_TEMPLATE(streamsRendering, G, genome_types) {
    G g(4);
    (void)g.insert_te(1, 1);
    std::ostringstream os;
    os << g;
    BOOST_CHECK_EQUAL(os.str(), "-A---");
}

BOOST_AUTO_TEST_CASE_TEMPLATE(summaryCountsCells, G, genome_types) {
    G g(10);
    const TEID id1 = g.insert_te(2, 3);
    (void)g.insert_te(8, 1);
    g.disable_te(id1);
    BOOST_CHECK_EQUAL(g.render(), "--xxx---A-----");

    const GenomeSummary ss = summarize(g);
    BOOST_CHECK_EQUAL(ss.length, 14);
    BOOST_CHECK_EQUAL(ss.empty_cells, 10);
    BOOST_CHECK_EQUAL(ss.active_cells, 1);
    BOOST_CHECK_EQUAL(ss.disabled_cells, 3);
    BOOST_CHECK_EQUAL(ss.active_tes, 1u);
    BOOST_CHECK_EQUAL(ss.ids_issued, 2u);
}

BOOST_AUTO_TEST_CASE(backendsAgreeOnScript) {
    ListGenome       list(12);
    LinkedListGenome linked(12);

    auto same = [&] {
        BOOST_CHECK_EQUAL(list.render(), linked.render());
        BOOST_CHECK(list.active_tes() == linked.active_tes());
        BOOST_CHECK_EQUAL(list.length(), linked.length());
    };

    BOOST_CHECK_EQUAL(list.insert_te(3, 4), linked.insert_te(3, 4));        same();
    BOOST_CHECK_EQUAL(list.insert_te(16, 2), linked.insert_te(16, 2));      same();
    BOOST_CHECK(list.copy_te(1, -7) == linked.copy_te(1, -7));              same();
    BOOST_CHECK_EQUAL(list.insert_te(5, 1), linked.insert_te(5, 1));        same();
    list.disable_te(2);  linked.disable_te(2);                              same();
    BOOST_CHECK(list.copy_te(3, 30) == linked.copy_te(3, 30));              same();
    BOOST_CHECK(list.copy_te(2, 1) == linked.copy_te(2, 1));                same();
    BOOST_CHECK_EQUAL(list.insert_te(list.length(), 3),
                      linked.insert_te(linked.length(), 3));               same();

    require_consistent(list);
    require_consistent(linked);
    BOOST_CHECK(linked.store().check_links());
}

BOOST_AUTO_TEST_SUITE_END()
