/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains declarations of member functions for MemNavDB class.
    MemNavDB is an in-memory navigation data set. Lookups follow insertion order.
*/

#pragma once

#include "nav_data.hpp"
#include <unordered_map>


namespace rtedec
{
    class MemNavDB: public NavDataSrc
    {
    public:
        MemNavDB() = default;

        void add_airport(airport_rec_t arpt);

        bool add_runway(const std::string& icao, runway_rec_t rwy);

        /*
            Function: add_terminal_wpt
            Description:
            Adds a VFR reporting point to an airport's terminal area.
            @param icao: airport whose terminal area gets the waypoint
            @param id: waypoint identifier
            @param pos: waypoint position
            @return true if the airport is known and the identifier is not
            yet used in that terminal area.
        */

        bool add_terminal_wpt(const std::string& icao, const std::string& id,
            geo::point pos);

        void add_enrt_wpt(const std::string& id, geo::point pos);

        // Merges other into this. Existing airports, runways and waypoints win.
        void append(const MemNavDB& other);

        void clear();

        size_t get_n_airports() const;

        size_t get_n_wpts() const;

        bool get_airport(const std::string& icao, airport_rec_t *out) const override;

        bool get_runway(const std::string& icao, const std::string& rwy_id,
            runway_rec_t *out) const override;

        bool get_terminal_wpt(const std::string& id, const std::string& area,
            wpt_rec_t *out) const override;

        size_t get_enrt_wpts(const std::string& id,
            std::vector<wpt_rec_t> *out) const override;

        std::string get_terminal_area(const std::string& icao) const override;

    private:
        std::vector<airport_rec_t> airports;
        std::unordered_map<std::string, size_t> arpt_idx;
        std::unordered_map<std::string, std::vector<runway_rec_t>> runways;

        std::vector<wpt_rec_t> wpts;  // Insertion order, all areas
        std::unordered_map<std::string, std::vector<size_t>> wpt_idx;


        bool has_wpt(const wpt_rec_t& wpt) const;
    };
}; // namespace rtedec
