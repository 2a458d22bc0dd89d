/*
	This project is licensed under
	Creative Commons Attribution-NonCommercial-ShareAlike 4.0 International Public License (CC BY-NC-SA 4.0).

	A SUMMARY OF THIS LICENSE CAN BE FOUND HERE: https://creativecommons.org/licenses/by-nc-sa/4.0/

	Author: discord/bruh4096#4512

	This file contains definitions of member functions for Route class and
    the route decoder.
*/

#include "route.hpp"


namespace rtedec
{
    struct word_t
    {
        token_t tok;
        TokenShape shape;
        bool is_arpt;
        fix_t arpt;
    };


    bool is_perf_word(const word_t& wd)
    {
        return !wd.is_arpt && (wd.shape == TokenShape::SPEED || 
            wd.shape == TokenShape::LEVEL || wd.shape == TokenShape::WIND);
    }

    bool is_wpt_word(const word_t& wd)
    {
        return !wd.is_arpt && (wd.shape == TokenShape::IDENT || 
            wd.shape == TokenShape::PERF_MALFORMED);
    }

    /*
        Function: classify_token
        Description:
        Gets the shape of a token and looks up airports. Identifiers that
        are not airports are left for waypoint resolution.
        @param tok: token
        @param nd: navigation data
        @param out: pointer to output word
        @return DecodeErr::SUCCESS or a token level error
    */

    DecodeErr classify_token(const token_t& tok, const NavDataSrc& nd, word_t *out)
    {
        out->tok = tok;
        out->shape = get_token_shape(tok.text);
        out->is_arpt = false;

        if(out->shape == TokenShape::INVALID)
            return DecodeErr::INVALID_TOKEN;

        std::string icao, rwy;
        if(out->shape == TokenShape::AIRPORT_RWY)
        {
            split_arpt_rwy(tok.text, &icao, &rwy);
            DecodeErr err = resolve_airport(icao, rwy, nd, &out->arpt);
            if(err != DecodeErr::SUCCESS)
                return err;
            out->is_arpt = true;
        }
        else if(out->shape == TokenShape::IDENT || out->shape == TokenShape::PERF_MALFORMED)
        {
            airport_rec_t arpt;
            if(nd.get_airport(tok.text, &arpt))
            {
                out->is_arpt = true;
                return resolve_airport(tok.text, "", nd, &out->arpt);
            }
            
            // 5 characters may still be an ICAO code with a 1 digit runway
            if(out->shape == TokenShape::IDENT && split_arpt_rwy(tok.text, &icao, &rwy) &&
                nd.get_airport(icao, &arpt))
            {
                out->is_arpt = true;
                return resolve_airport(icao, rwy, nd, &out->arpt);
            }
        }

        return DecodeErr::SUCCESS;
    }

    // Area of the next airport fix before the next DCT. Empty if there is none.
    std::string get_incoming_area(const std::vector<word_t>& words, size_t idx)
    {
        for(size_t i = idx + 1; i < words.size(); i++)
        {
            if(words[i].shape == TokenShape::VIA)
                return "";
            if(words[i].is_arpt)
                return words[i].arpt.area;
        }
        return "";
    }

    // DCT <airport> only opens the airport's area if a waypoint comes next
    bool is_scope_only_arpt(const std::vector<word_t>& words, size_t idx)
    {
        if(idx == 0 || words[idx-1].shape != TokenShape::VIA)
            return false;

        for(size_t i = idx + 1; i < words.size(); i++)
        {
            if(is_perf_word(words[i]))
                continue;
            return is_wpt_word(words[i]);
        }
        return false;
    }


    DecodeErr decode(const std::string& rte_str, const NavDataSrc& nd, Route *out,
        const leg_env_t& env, err_info_t *err)
    {
        std::vector<token_t> tokens;
        DecodeErr scan_err = scan_route(rte_str, &tokens, err);
        if(scan_err != DecodeErr::SUCCESS)
            return scan_err;

        std::vector<word_t> words(tokens.size());
        for(size_t i = 0; i < tokens.size(); i++)
        {
            DecodeErr wd_err = classify_token(tokens[i], nd, &words[i]);
            if(wd_err != DecodeErr::SUCCESS)
                return set_err(err, wd_err, tokens[i].text, tokens[i].pos);
        }

        TermScope scope;
        PerfInterp perf;
        std::vector<fix_entry_t> fixes;

        for(size_t i = 0; i < words.size(); i++)
        {
            const word_t& curr = words[i];

            if(curr.shape == TokenShape::VIA)
            {
                scope = scope.on_dct();
            }
            else if(curr.is_arpt)
            {
                if(is_scope_only_arpt(words, i))
                {
                    // Not a fix, so there is nothing to take off from or land on
                    if(curr.arpt.has_rwy)
                        return set_err(err, DecodeErr::INVALID_RUNWAY, curr.tok.text, 
                            curr.tok.pos);
                    scope = scope.on_dct_airport(curr.arpt.area);
                }
                else
                {
                    scope = scope.on_airport(curr.arpt.area);
                    fixes.push_back({curr.arpt, perf.get_snapshot()});
                }
            }
            else if(is_perf_word(curr))
            {
                perf.apply(curr.tok.text);
            }
            else
            {
                TermScope wpt_scope = scope.toward(get_incoming_area(words, i));

                fix_t wpt;
                DecodeErr wpt_err = resolve_wpt(curr.tok.text, wpt_scope, nd, &wpt);
                if(wpt_err == DecodeErr::UNKNOWN_WPT && 
                    curr.shape == TokenShape::PERF_MALFORMED)
                {
                    wpt_err = DecodeErr::INVALID_PERF_FORMAT;
                }
                if(wpt_err != DecodeErr::SUCCESS)
                    return set_err(err, wpt_err, curr.tok.text, curr.tok.pos);

                fixes.push_back({wpt, perf.get_snapshot()});
            }
        }

        std::vector<leg_t> legs;
        DecodeErr leg_err = build_legs(fixes, env, &legs);
        if(leg_err != DecodeErr::SUCCESS)
        {
            if(fixes.size())
                return set_err(err, leg_err, fixes[0].fix.get_name());
            return set_err(err, leg_err);
        }

        out->tokens = tokens;
        out->legs = legs;
        out->crz_spd = perf.get_cruise_spd();
        out->crz_lvl = perf.get_cruise_lvl();

        return set_err(err, DecodeErr::SUCCESS);
    }

    // Route member function definitions:

    // Public member functions:

    Route::Route()
    {
        tokens = {};
        legs = {};
    }

    const std::vector<leg_t>& Route::get_legs() const
    {
        return legs;
    }

    size_t Route::get_n_legs() const
    {
        return legs.size();
    }

    bool Route::get_origin(fix_t *out) const
    {
        if(!legs.size())
            return false;
        *out = legs[0].origin;
        return true;
    }

    bool Route::get_dest(fix_t *out) const
    {
        if(!legs.size())
            return false;
        *out = legs.back().dest;
        return true;
    }

    bool Route::get_dep_arpt(fix_t *out) const
    {
        if(legs.empty())
            return false;

        if(legs[0].origin.tp == FixType::AIRPORT)
        {
            *out = legs[0].origin;
            return true;
        }
        for(size_t i = 0; i < legs.size(); i++)
        {
            if(legs[i].dest.tp == FixType::AIRPORT)
            {
                *out = legs[i].dest;
                return true;
            }
        }
        return false;
    }

    bool Route::get_arr_arpt(fix_t *out) const
    {
        // The first airport of the chain is never the destination
        bool seen_first = !legs.empty() && legs[0].origin.tp == FixType::AIRPORT;
        int last = -1;
        for(size_t i = 0; i < legs.size(); i++)
        {
            if(legs[i].dest.tp != FixType::AIRPORT)
                continue;
            if(seen_first)
                last = int(i);
            seen_first = true;
        }

        if(last < 0)
            return false;
        *out = legs[size_t(last)].dest;
        return true;
    }

    bool Route::get_takeoff_rwy(std::string *out) const
    {
        fix_t arpt;
        if(!get_dep_arpt(&arpt) || !arpt.has_rwy)
            return false;
        *out = arpt.rwy_id;
        return true;
    }

    bool Route::get_landing_rwy(std::string *out) const
    {
        fix_t arpt;
        if(!get_arr_arpt(&arpt) || !arpt.has_rwy)
            return false;
        *out = arpt.rwy_id;
        return true;
    }

    std::optional<speed_t> Route::get_cruise_spd() const
    {
        return crz_spd;
    }

    std::optional<level_t> Route::get_cruise_lvl() const
    {
        return crz_lvl;
    }

    std::vector<leg_totals_t> Route::accumulate_legs() const
    {
        std::vector<leg_totals_t> out;

        leg_totals_t curr = {0, 0.0, 0.0};
        for(size_t i = 0; i < legs.size(); i++)
        {
            curr.dist_nm += legs[i].dist_nm;

            if(curr.ete_hr.has_value() && legs[i].ete_hr.has_value())
                curr.ete_hr = curr.ete_hr.value() + legs[i].ete_hr.value();
            else
                curr.ete_hr.reset();

            if(curr.fuel.has_value() && legs[i].fuel.has_value())
                curr.fuel = curr.fuel.value() + legs[i].fuel.value();
            else
                curr.fuel.reset();

            out.push_back(curr);
        }

        return out;
    }

    bool Route::get_totals(leg_totals_t *out) const
    {
        std::vector<leg_totals_t> acc = accumulate_legs();
        if(!acc.size())
            return false;
        *out = acc.back();
        return true;
    }

    std::string Route::to_str() const
    {
        std::string out;
        for(size_t i = 0; i < tokens.size(); i++)
        {
            if(i)
                out += " ";
            out += tokens[i].text;
        }
        return out;
    }
}; // namespace rtedec
