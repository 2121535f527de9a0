#include <Settler/options.hpp>
#include <Settler/token/amount.hpp>
#include <algorithm>
#include <charconv>
#include <cstdlib>

namespace Settler {

    maybe<std::string> options::read (const std::string &name) const {
        maybe<std::string> x;
        this->get (name, x);
        if (bool (x)) return x;

        std::string env_name = string::write ("SETTLER_", name);
        std::transform (env_name.begin (), env_name.end (), env_name.begin (),
            [] (unsigned char c) {
                return std::toupper (c);
            });

        const char *val = std::getenv (env_name.c_str ());
        if (bool (val)) return std::string {val};
        return {};
    }

    Settler::endpoints options::endpoints () const {
        Settler::endpoints e {};

        if (maybe<std::string> scheme = read ("scheme"); bool (scheme)) e.Scheme = *scheme;
        if (maybe<std::string> host = read ("token_api"); bool (host)) e.TokenAPIHost = *host;
        if (maybe<std::string> host = read ("ordinals_api"); bool (host)) e.OrdinalsHost = *host;
        if (maybe<std::string> token = read ("api_token"); bool (token)) e.APIToken = *token;

        return e;
    }

    maybe<Bitcoin::secret> options::key () const {
        maybe<std::string> wif = read ("wif");
        if (!bool (wif)) return {};

        Bitcoin::secret k {*wif};
        if (!k.valid ()) throw exception {failure::invalid_request, "could not read WIF key"};
        return k;
    }

    maybe<Bitcoin::address> options::address () const {
        maybe<std::string> addr = read ("address");
        if (!bool (addr)) {
            maybe<Bitcoin::secret> k = key ();
            if (!bool (k)) return {};
            return k->address ();
        }

        Bitcoin::address a {*addr};
        if (!a.valid ()) throw exception {failure::invalid_request, string::write ("invalid address ", *addr)};
        return a;
    }

    namespace {
        recipient read_recipient (const std::string &addr, const std::string &amount) {
            Bitcoin::address a {addr};
            if (!a.valid ()) throw exception {failure::invalid_request, string::write ("invalid address ", addr)};

            maybe<double> x = read_decimal (amount);
            if (!bool (x)) throw exception {failure::invalid_request, string::write ("invalid amount ", amount)};

            return recipient {a, *x};
        }
    }

    transfer_request options::recipients () const {
        maybe<std::string> many = read ("recipients");
        if (bool (many)) {
            transfer_request request;
            std::stringstream ss {*many};
            std::string entry;
            while (std::getline (ss, entry, ',')) {
                size_t colon = entry.find (':');
                if (colon == std::string::npos) throw exception {failure::invalid_request,
                    string::write ("expected <address>:<amount> but got ", entry)};
                request <<= read_recipient (entry.substr (0, colon), entry.substr (colon + 1));
            }

            return request;
        }

        maybe<std::string> to = read ("to");
        maybe<std::string> amount = read ("amount");
        if (!bool (to)) throw exception {failure::invalid_request, "no recipient provided"};
        if (!bool (amount)) throw exception {failure::invalid_request, "no amount provided"};

        return transfer_request {read_recipient (*to, *amount)};
    }

    settlement_mode options::mode () const {
        return this->has ("sync") ? settlement_mode::synchronous : settlement_mode::ticket;
    }

    maybe<std::string> options::ticket () const {
        return read ("ticket");
    }

    poll_options options::polling () const {
        poll_options p {};

        if (maybe<std::string> attempts = read ("poll_attempts"); bool (attempts)) {
            auto [_, ec] = std::from_chars (attempts->data (), attempts->data () + attempts->size (), p.MaxAttempts);
            if (ec != std::errc ()) throw data::exception {} << "could not parse poll_attempts " << *attempts;
        }

        if (maybe<std::string> interval = read ("poll_interval"); bool (interval)) {
            uint32 seconds;
            auto [_, ec] = std::from_chars (interval->data (), interval->data () + interval->size (), seconds);
            if (ec != std::errc ()) throw data::exception {} << "could not parse poll_interval " << *interval;
            p.Interval = std::chrono::seconds (seconds);
        }

        return p;
    }

}
