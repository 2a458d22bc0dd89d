/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of member functions for TermScope class.
    TermScope tracks which terminal areas waypoints may be implicitly 
    resolved in. Every transition returns a new value, the old one is left
    untouched.
*/

#pragma once

#include <string>
#include <vector>


namespace rtedec
{
    enum class ScopeState
    {
        CLOSED,
        OPEN,
        CROSSING
    };


    class TermScope
    {
    public:
        TermScope();

        ScopeState get_state() const;

        // OPEN: the open area. CROSSING: the area being left.
        std::string get_area() const;

        // CROSSING only: the area being approached.
        std::string get_next_area() const;

        // True if the area returned by get_area was opened by DCT <airport>
        bool is_pinned() const;

        std::vector<std::string> get_areas() const;

        // Airport fix: Open(area)
        TermScope on_airport(const std::string& area) const;

        // DCT <airport> without the airport becoming a fix: pinned Open(area)
        TermScope on_dct_airport(const std::string& area) const;

        // Bare DCT: Closed
        TermScope on_dct() const;

        /*
            Function: toward
            Description:
            Gets the scope seen by a waypoint that lies before the next airport
            of the route, with no DCT in between.
            @param next_area: terminal area of that airport. Empty if there is none.
            @return Open or Crossing scope, or this scope if nothing changes
        */

        TermScope toward(const std::string& next_area) const;

    private:
        ScopeState state;
        std::string area_from, area_to;
        bool pinned;


        TermScope(ScopeState st, std::string from, std::string to, bool pin);
    };

    bool operator==(TermScope const& a, TermScope const& b);
}; // namespace rtedec
