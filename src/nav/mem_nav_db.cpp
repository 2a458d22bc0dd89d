/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of member functions for MemNavDB class.
    MemNavDB is an in-memory navigation data set. Lookups follow insertion order.
*/

#include "mem_nav_db.hpp"


namespace rtedec
{
    // MemNavDB member function definitions:

    // Public member functions:

    void MemNavDB::add_airport(airport_rec_t arpt)
    {
        if(arpt_idx.find(arpt.icao) != arpt_idx.end())
        {
            airports[arpt_idx[arpt.icao]] = arpt;
            return;
        }

        arpt_idx[arpt.icao] = airports.size();
        airports.push_back(arpt);
    }

    bool MemNavDB::add_runway(const std::string& icao, runway_rec_t rwy)
    {
        if(arpt_idx.find(icao) == arpt_idx.end())
            return false;

        std::vector<runway_rec_t>& rwys = runways[icao];
        for(size_t i = 0; i < rwys.size(); i++)
        {
            if(rwys[i].id == rwy.id)
            {
                rwys[i] = rwy;
                return true;
            }
        }
        rwys.push_back(rwy);
        return true;
    }

    bool MemNavDB::add_terminal_wpt(const std::string& icao, const std::string& id,
        geo::point pos)
    {
        if(arpt_idx.find(icao) == arpt_idx.end())
            return false;

        std::string area = get_terminal_area(icao);
        wpt_rec_t tmp;
        if(get_terminal_wpt(id, area, &tmp))
            return false;

        wpt_idx[id].push_back(wpts.size());
        wpts.push_back({id, area, pos, WptUsage::VFR_TERMINAL});
        return true;
    }

    void MemNavDB::add_enrt_wpt(const std::string& id, geo::point pos)
    {
        wpt_idx[id].push_back(wpts.size());
        wpts.push_back({id, ENRT_AREA, pos, WptUsage::VFR_ENROUTE});
    }

    void MemNavDB::append(const MemNavDB& other)
    {
        if(&other == this)
            return;

        for(size_t i = 0; i < other.airports.size(); i++)
        {
            const airport_rec_t& arpt = other.airports[i];
            if(arpt_idx.find(arpt.icao) == arpt_idx.end())
                add_airport(arpt);
        }

        for(auto it = other.runways.begin(); it != other.runways.end(); it++)
        {
            runway_rec_t tmp;
            for(size_t i = 0; i < it->second.size(); i++)
            {
                if(!get_runway(it->first, it->second[i].id, &tmp))
                    add_runway(it->first, it->second[i]);
            }
        }

        for(size_t i = 0; i < other.wpts.size(); i++)
        {
            const wpt_rec_t& wpt = other.wpts[i];
            if(has_wpt(wpt))
                continue;
            
            wpt_idx[wpt.id].push_back(wpts.size());
            wpts.push_back(wpt);
        }
    }

    void MemNavDB::clear()
    {
        airports.clear();
        arpt_idx.clear();
        runways.clear();
        wpts.clear();
        wpt_idx.clear();
    }

    size_t MemNavDB::get_n_airports() const
    {
        return airports.size();
    }

    size_t MemNavDB::get_n_wpts() const
    {
        return wpts.size();
    }

    bool MemNavDB::get_airport(const std::string& icao, airport_rec_t *out) const
    {
        auto it = arpt_idx.find(icao);
        if(it == arpt_idx.end())
            return false;

        *out = airports[it->second];
        return true;
    }

    bool MemNavDB::get_runway(const std::string& icao, const std::string& rwy_id,
        runway_rec_t *out) const
    {
        auto it = runways.find(icao);
        if(it == runways.end())
            return false;

        for(size_t i = 0; i < it->second.size(); i++)
        {
            if(it->second[i].id == rwy_id)
            {
                *out = it->second[i];
                return true;
            }
        }
        return false;
    }

    bool MemNavDB::get_terminal_wpt(const std::string& id, const std::string& area,
        wpt_rec_t *out) const
    {
        auto it = wpt_idx.find(id);
        if(it == wpt_idx.end())
            return false;

        for(size_t i = 0; i < it->second.size(); i++)
        {
            const wpt_rec_t& curr = wpts[it->second[i]];
            if(curr.usage == WptUsage::VFR_TERMINAL && curr.area == area)
            {
                *out = curr;
                return true;
            }
        }
        return false;
    }

    size_t MemNavDB::get_enrt_wpts(const std::string& id,
        std::vector<wpt_rec_t> *out) const
    {
        out->clear();

        auto it = wpt_idx.find(id);
        if(it == wpt_idx.end())
            return 0;

        for(size_t i = 0; i < it->second.size(); i++)
        {
            const wpt_rec_t& curr = wpts[it->second[i]];
            if(curr.usage == WptUsage::VFR_ENROUTE)
                out->push_back(curr);
        }
        return out->size();
    }

    std::string MemNavDB::get_terminal_area(const std::string& icao) const
    {
        return icao;
    }

    // Private member functions:

    bool MemNavDB::has_wpt(const wpt_rec_t& wpt) const
    {
        auto it = wpt_idx.find(wpt.id);
        if(it == wpt_idx.end())
            return false;

        for(size_t i = 0; i < it->second.size(); i++)
        {
            const wpt_rec_t& curr = wpts[it->second[i]];
            if(curr.usage != wpt.usage || curr.area != wpt.area)
                continue;
            // One reporting point per identifier and terminal area
            if(curr.usage == WptUsage::VFR_TERMINAL || curr == wpt)
                return true;
        }
        return false;
    }
}; // namespace rtedec
