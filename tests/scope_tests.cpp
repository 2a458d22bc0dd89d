/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains tests of terminal area scope transitions.
*/

#include "test_framework.hpp"
#include "rte/scope.hpp"


namespace
{
    using namespace rtedec;


    bool test_initial_state_closed()
    {
        TermScope scope;

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::CLOSED);
        RTEDEC_EXPECT_EQ(scope.get_areas().size(), size_t(0));
        RTEDEC_EXPECT_TRUE(!scope.is_pinned());
        return true;
    }

    bool test_airport_opens_area()
    {
        TermScope scope = TermScope().on_airport("EDDH");

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::OPEN);
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDDH"));
        RTEDEC_EXPECT_TRUE(!scope.is_pinned());

        // A later airport replaces the area
        TermScope next = scope.on_airport("EDHL");
        RTEDEC_EXPECT_EQ(next.get_area(), std::string("EDHL"));
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDDH"));
        return true;
    }

    bool test_dct_airport_pins_area()
    {
        TermScope scope = TermScope().on_airport("EDHL").on_dct().on_dct_airport("EDAH");

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::OPEN);
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDAH"));
        RTEDEC_EXPECT_TRUE(scope.is_pinned());
        return true;
    }

    bool test_dct_closes()
    {
        TermScope open = TermScope().on_airport("EDDH");
        TermScope crossing = open.toward("EDHL");

        RTEDEC_EXPECT_TRUE(open.on_dct().get_state() == ScopeState::CLOSED);
        RTEDEC_EXPECT_TRUE(crossing.on_dct().get_state() == ScopeState::CLOSED);
        RTEDEC_EXPECT_TRUE(open.on_dct() == TermScope());
        return true;
    }

    bool test_toward_next_airport_crosses()
    {
        TermScope scope = TermScope().on_airport("EDDH").toward("EDHL");

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::CROSSING);
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDDH"));
        RTEDEC_EXPECT_EQ(scope.get_next_area(), std::string("EDHL"));
        RTEDEC_EXPECT_EQ(scope.get_areas().size(), size_t(2));
        return true;
    }

    bool test_toward_same_or_no_airport_keeps_scope()
    {
        TermScope open = TermScope().on_airport("EDDH");

        RTEDEC_EXPECT_TRUE(open.toward("EDDH") == open);
        RTEDEC_EXPECT_TRUE(open.toward("") == open);
        RTEDEC_EXPECT_TRUE(TermScope().toward("") == TermScope());
        return true;
    }

    bool test_toward_from_closed_opens_incoming()
    {
        TermScope scope = TermScope().toward("EDAH");

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::OPEN);
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDAH"));
        RTEDEC_EXPECT_TRUE(!scope.is_pinned());
        return true;
    }

    bool test_crossing_keeps_pin()
    {
        TermScope scope = TermScope().on_dct_airport("EDAH").toward("EDHL");

        RTEDEC_EXPECT_TRUE(scope.get_state() == ScopeState::CROSSING);
        RTEDEC_EXPECT_TRUE(scope.is_pinned());
        RTEDEC_EXPECT_EQ(scope.get_area(), std::string("EDAH"));
        return true;
    }
}


int main()
{
    std::vector<rtedec::test::test_case_t> cases = {
        {"initial_state_closed", test_initial_state_closed},
        {"airport_opens_area", test_airport_opens_area},
        {"dct_airport_pins_area", test_dct_airport_pins_area},
        {"dct_closes", test_dct_closes},
        {"toward_next_airport_crosses", test_toward_next_airport_crosses},
        {"toward_same_or_no_airport_keeps_scope", test_toward_same_or_no_airport_keeps_scope},
        {"toward_from_closed_opens_incoming", test_toward_from_closed_opens_incoming},
        {"crossing_keeps_pin", test_crossing_keeps_pin}
    };

    return rtedec::test::run_all(cases);
}
