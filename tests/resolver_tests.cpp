/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains tests of airport and waypoint resolution.
*/

#include "test_framework.hpp"
#include "nav_fixture.hpp"
#include "rte/fix_resolver.hpp"


namespace
{
    using namespace rtedec;


    bool test_airport_with_runway()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        RTEDEC_EXPECT_EQ(resolve_airport("EDDH", "33", *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(fix.tp == FixType::AIRPORT);
        RTEDEC_EXPECT_TRUE(fix.has_rwy);
        RTEDEC_EXPECT_EQ(fix.rwy_id, std::string("33"));
        RTEDEC_EXPECT_EQ(fix.get_name(), std::string("EDDH33"));
        RTEDEC_EXPECT_EQ(fix.area, std::string("EDDH"));

        RTEDEC_EXPECT_EQ(resolve_airport("EDDH", "", *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(!fix.has_rwy);
        return true;
    }

    bool test_airport_errors()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        RTEDEC_EXPECT_EQ(resolve_airport("XXXX", "", *db, &fix), DecodeErr::UNKNOWN_AIRPORT);
        RTEDEC_EXPECT_EQ(resolve_airport("XXXX", "33", *db, &fix), DecodeErr::UNKNOWN_AIRPORT);
        RTEDEC_EXPECT_EQ(resolve_airport("EDDH", "99", *db, &fix), DecodeErr::INVALID_RUNWAY);
        return true;
    }

    bool test_open_area_prefers_terminal()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        TermScope scope = TermScope().on_airport("EDDH");
        RTEDEC_EXPECT_EQ(resolve_wpt("N2", scope, *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(fix.usage == WptUsage::VFR_TERMINAL);
        RTEDEC_EXPECT_EQ(fix.area, std::string("EDDH"));

        // Same identifier outside any terminal area is the enroute one
        RTEDEC_EXPECT_EQ(resolve_wpt("N2", TermScope(), *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(fix.usage == WptUsage::VFR_ENROUTE);
        RTEDEC_EXPECT_EQ(fix.area, ENRT_AREA);
        return true;
    }

    bool test_closed_scope_skips_terminal()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        RTEDEC_EXPECT_EQ(resolve_wpt("P2", TermScope(), *db, &fix), DecodeErr::UNKNOWN_WPT);
        RTEDEC_EXPECT_EQ(resolve_wpt("W", TermScope(), *db, &fix), DecodeErr::UNKNOWN_WPT);
        return true;
    }

    bool test_open_area_falls_back_to_enroute()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        TermScope scope = TermScope().on_airport("EDDH");
        RTEDEC_EXPECT_EQ(resolve_wpt("HAM", scope, *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(fix.usage == WptUsage::VFR_ENROUTE);
        return true;
    }

    bool test_crossing_single_match_wins()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        TermScope scope = TermScope().on_airport("EDDH").toward("EDHL");
        RTEDEC_EXPECT_EQ(resolve_wpt("W", scope, *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_EQ(fix.area, std::string("EDHL"));

        RTEDEC_EXPECT_EQ(resolve_wpt("P2", scope, *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_EQ(fix.area, std::string("EDDH"));
        return true;
    }

    bool test_crossing_double_match_is_ambiguous()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        TermScope scope = TermScope().on_airport("EDAH").toward("EDHL");
        RTEDEC_EXPECT_EQ(resolve_wpt("W", scope, *db, &fix), DecodeErr::AMBIGUOUS_WPT);
        return true;
    }

    bool test_pinned_crossing_uses_pinned_area()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;

        TermScope scope = TermScope().on_dct_airport("EDAH").toward("EDHL");
        RTEDEC_EXPECT_EQ(resolve_wpt("W", scope, *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_EQ(fix.area, std::string("EDAH"));
        return true;
    }

    bool test_enroute_first_match_wins()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        fix_t fix;
        std::vector<wpt_rec_t> all;

        RTEDEC_EXPECT_EQ(db->get_enrt_wpts("LBE", &all), size_t(2));
        RTEDEC_EXPECT_EQ(resolve_wpt("LBE", TermScope(), *db, &fix), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_NEAR(fix.pos.lat_rad, all[0].pos.lat_rad, 1e-12);
        RTEDEC_EXPECT_NEAR(fix.pos.lat_rad * geo::RAD_TO_DEG, 53.85, 1e-9);
        return true;
    }

    bool test_mem_db_append_keeps_order()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        MemNavDB other;
        other.add_enrt_wpt("LBE", test::deg_pt(10, 10));
        other.add_airport({"EDDH", test::deg_pt(0, 0), 0});
        other.add_airport({"LOWW", test::deg_pt(48.11, 16.57), 600});

        size_t n_arpt = db->get_n_airports();
        db->append(other);

        std::vector<wpt_rec_t> all;
        RTEDEC_EXPECT_EQ(db->get_enrt_wpts("LBE", &all), size_t(3));
        RTEDEC_EXPECT_NEAR(all[0].pos.lat_rad * geo::RAD_TO_DEG, 53.85, 1e-9);
        RTEDEC_EXPECT_EQ(db->get_n_airports(), n_arpt + 1);

        airport_rec_t arpt;
        RTEDEC_EXPECT_TRUE(db->get_airport("EDDH", &arpt));
        RTEDEC_EXPECT_NEAR(arpt.pos.lat_rad * geo::RAD_TO_DEG, 53.6304, 1e-9);

        db->clear();
        RTEDEC_EXPECT_EQ(db->get_n_wpts(), size_t(0));
        RTEDEC_EXPECT_TRUE(!db->get_airport("EDDH", &arpt));
        return true;
    }

    bool test_mem_db_append_skips_known_wpts()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        size_t n_wpts = db->get_n_wpts();
        size_t n_arpt = db->get_n_airports();

        db->append(*db);
        RTEDEC_EXPECT_EQ(db->get_n_wpts(), n_wpts);
        RTEDEC_EXPECT_EQ(db->get_n_airports(), n_arpt);

        MemNavDB other;
        other.add_enrt_wpt("LBE", test::deg_pt(53.85, 10.50));
        other.add_enrt_wpt("LBE", test::deg_pt(40, 0));
        other.add_enrt_wpt("HAM", test::deg_pt(10, 10));
        db->append(other);

        std::vector<wpt_rec_t> all;
        RTEDEC_EXPECT_EQ(db->get_enrt_wpts("LBE", &all), size_t(2));
        RTEDEC_EXPECT_EQ(db->get_enrt_wpts("HAM", &all), size_t(2));
        RTEDEC_EXPECT_EQ(db->get_n_wpts(), n_wpts + 1);
        return true;
    }

    bool test_same_name_fixes_differ_by_position()
    {
        std::shared_ptr<MemNavDB> db = test::make_test_db();
        std::vector<wpt_rec_t> all;
        RTEDEC_EXPECT_EQ(db->get_enrt_wpts("LBE", &all), size_t(2));

        fix_t first;
        fix_t again;
        RTEDEC_EXPECT_EQ(resolve_wpt("LBE", TermScope(), *db, &first), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_EQ(resolve_wpt("LBE", TermScope(), *db, &again), DecodeErr::SUCCESS);
        RTEDEC_EXPECT_TRUE(first == again);

        fix_t other = first;
        other.pos = all[1].pos;
        RTEDEC_EXPECT_TRUE(first != other);
        return true;
    }

    bool test_mem_db_rejects_duplicate_terminal_wpt()
    {
        MemNavDB db;
        db.add_airport({"EDHL", test::deg_pt(53.8, 10.7), 0});

        RTEDEC_EXPECT_TRUE(db.add_terminal_wpt("EDHL", "W", test::deg_pt(53.8, 10.5)));
        RTEDEC_EXPECT_TRUE(!db.add_terminal_wpt("EDHL", "W", test::deg_pt(53.9, 10.5)));
        RTEDEC_EXPECT_TRUE(!db.add_terminal_wpt("EDAH", "W", test::deg_pt(53.9, 14.0)));
        RTEDEC_EXPECT_TRUE(!db.add_runway("EDAH", {"10", {}, {}}));
        return true;
    }
}


int main()
{
    std::vector<rtedec::test::test_case_t> cases = {
        {"airport_with_runway", test_airport_with_runway},
        {"airport_errors", test_airport_errors},
        {"open_area_prefers_terminal", test_open_area_prefers_terminal},
        {"closed_scope_skips_terminal", test_closed_scope_skips_terminal},
        {"open_area_falls_back_to_enroute", test_open_area_falls_back_to_enroute},
        {"crossing_single_match_wins", test_crossing_single_match_wins},
        {"crossing_double_match_is_ambiguous", test_crossing_double_match_is_ambiguous},
        {"pinned_crossing_uses_pinned_area", test_pinned_crossing_uses_pinned_area},
        {"enroute_first_match_wins", test_enroute_first_match_wins},
        {"mem_db_append_keeps_order", test_mem_db_append_keeps_order},
        {"mem_db_append_skips_known_wpts", test_mem_db_append_skips_known_wpts},
        {"same_name_fixes_differ_by_position", test_same_name_fixes_differ_by_position},
        {"mem_db_rejects_duplicate_terminal_wpt", test_mem_db_rejects_duplicate_terminal_wpt}
    };

    return rtedec::test::run_all(cases);
}
