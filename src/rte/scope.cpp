/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of member functions for TermScope class.
    TermScope tracks which terminal areas waypoints may be implicitly 
    resolved in.
*/

#include "scope.hpp"


namespace rtedec
{
    // TermScope member function definitions:

    // Public member functions:

    TermScope::TermScope()
    {
        state = ScopeState::CLOSED;
        pinned = false;
    }

    ScopeState TermScope::get_state() const
    {
        return state;
    }

    std::string TermScope::get_area() const
    {
        return area_from;
    }

    std::string TermScope::get_next_area() const
    {
        return area_to;
    }

    bool TermScope::is_pinned() const
    {
        return pinned;
    }

    std::vector<std::string> TermScope::get_areas() const
    {
        if(state == ScopeState::OPEN)
            return {area_from};
        if(state == ScopeState::CROSSING)
            return {area_from, area_to};
        return {};
    }

    TermScope TermScope::on_airport(const std::string& area) const
    {
        return TermScope(ScopeState::OPEN, area, "", false);
    }

    TermScope TermScope::on_dct_airport(const std::string& area) const
    {
        return TermScope(ScopeState::OPEN, area, "", true);
    }

    TermScope TermScope::on_dct() const
    {
        return TermScope();
    }

    TermScope TermScope::toward(const std::string& next_area) const
    {
        if(next_area == "")
            return *this;

        if(state == ScopeState::CLOSED)
            return TermScope(ScopeState::OPEN, next_area, "", false);

        if(state == ScopeState::OPEN && next_area != area_from)
            return TermScope(ScopeState::CROSSING, area_from, next_area, pinned);
        
        if(state == ScopeState::CROSSING && next_area != area_to)
        {
            if(next_area == area_from)
                return TermScope(ScopeState::OPEN, area_from, "", pinned);
            return TermScope(ScopeState::CROSSING, area_from, next_area, pinned);
        }

        return *this;
    }

    // Private member functions:

    TermScope::TermScope(ScopeState st, std::string from, std::string to, bool pin)
    {
        state = st;
        area_from = from;
        area_to = to;
        pinned = pin;
    }


    bool operator==(TermScope const& a, TermScope const& b)
    {
        return a.get_state() == b.get_state() && a.get_area() == b.get_area() &&
            a.get_next_area() == b.get_next_area() && a.is_pinned() == b.is_pinned();
    }
}; // namespace rtedec
