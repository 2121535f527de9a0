#include <csignal>

#include <data/io/exception.hpp>

#include <Settler/network.hpp>
#include <Settler/options.hpp>
#include <Settler/transfer.hpp>
#include <Settler/token/amount.hpp>

using namespace data;

Settler::error run (const Settler::options &);

enum class method {
    UNSET,
    HELP,     // print help messages
    VERSION,  // print a version message
    CONFIG,   // print the token config
    BALANCE,  // the token balance of an address
    TRANSFER, // send tokens
    STATUS    // check on a ticket
};

int main (int arg_count, char **arg_values) {

    auto err = run (Settler::options {io::arg_parser {arg_count, arg_values}});

    if (err.Message) std::cout << "Error: " << static_cast<std::string> (*err.Message) << std::endl;
    else if (err.Code) std::cout << "Error: unknown." << std::endl;

    return err.Code;
}

void version ();

void help (method meth = method::UNSET);

void command_config (const Settler::options &);
void command_balance (const Settler::options &);
void command_transfer (const Settler::options &);
void command_status (const Settler::options &);

method read_method (const io::arg_parser &, uint32 index = 1);

Settler::error run (const Settler::options &p) {

    try {

        if (p.has ("version")) version ();

        else if (p.has ("help")) help ();

        else {

            method cmd = read_method (p);

            switch (cmd) {
                case method::VERSION: {
                    version ();
                    break;
                }

                case method::HELP: {
                    help (read_method (p, 2));
                    break;
                }

                case method::CONFIG: {
                    command_config (p);
                    break;
                }

                case method::BALANCE: {
                    command_balance (p);
                    break;
                }

                case method::TRANSFER: {
                    command_transfer (p);
                    break;
                }

                case method::STATUS: {
                    command_status (p);
                    break;
                }

                default: {
                    std::cout << "Error: could not read user's command." << std::endl;
                    help ();
                }
            }
        }

    } catch (const Settler::exception &x) {
        if (x.rejected ()) std::cout << "Transfer rejected (" << x.Reason << ")" << std::endl;
        return Settler::error {x.Code, std::string {x.what ()}};
    } catch (const net::HTTP::exception &x) {
        std::cout << "Problem with http: " << std::endl;
        std::cout << "\trequest: " << x.Request << std::endl;
        std::cout << "\tresponse: " << x.Response << std::endl;
        return Settler::error {1, std::string {x.what ()}};
    } catch (const data::exception &x) {
        return Settler::error {x.Code, std::string {x.what ()}};
    } catch (const std::exception &x) {
        return Settler::error {1, std::string {x.what ()}};
    }

    return {};
}

method read_method (const io::arg_parser &p, uint32 index) {
    maybe<std::string> m;
    p.get (index, m);
    if (!bool (m)) return method::UNSET;

    std::string x = data::to_lower (*m);

    if (x == "help") return method::HELP;
    if (x == "version") return method::VERSION;
    if (x == "config") return method::CONFIG;
    if (x == "balance") return method::BALANCE;
    if (x == "transfer") return method::TRANSFER;
    if (x == "status") return method::STATUS;

    return method::UNSET;
}

void version () {
    std::cout << "Settler version 0.1.0" << std::endl;
}

void help (method meth) {
    switch (meth) {
        default : {
            version ();
            std::cout << "input should be <method> <args>... where method is "
                "\n\tconfig     -- print the token configuration."
                "\n\tbalance    -- print the token balance of an address."
                "\n\ttransfer   -- send tokens to one or more addresses."
                "\n\tstatus     -- check on a transfer that was submitted with a ticket."
                "\nuse help \"method\" for information on a specific method"
                "\nevery option may also be given in the environment as SETTLER_<OPTION>, for example SETTLER_API_TOKEN."
                "\nservice options:"
                "\n\t(--api_token=<token>)"
                "\n\t(--token_api=<host>) (= proxy-api.mnee.net)"
                "\n\t(--ordinals_api=<host>) (= ordinals.1sat.app)"
                "\n\t(--scheme=<http|https>) (= https)" << std::endl;
        } break;
        case method::CONFIG : {
            std::cout << "Print the token configuration. No parameters." << std::endl;
        } break;
        case method::BALANCE : {
            std::cout << "Print the token balance of an address."
                "\narguments for method balance:"
                "\n\t(--address=<address>) (if absent, the address of --wif)"
                "\n\t(--wif=<WIF private key>)" << std::endl;
        } break;
        case method::TRANSFER : {
            std::cout << "Send tokens. Without --sync the transfer is submitted with a ticket "
                "which is polled until the transfer settles."
                "\narguments for method transfer:"
                "\n\t(--wif=)<WIF private key>"
                "\n\t(--to=<address>) (--amount=<decimal amount>)"
                "\n\t(--recipients=<address>:<amount>,<address>:<amount>,...)"
                "\n\t(--sync) (wait for the cosigner and broadcast the transaction ourselves)"
                "\n\t(--poll_attempts=<uint32>) (= 60)"
                "\n\t(--poll_interval=<seconds>) (= 5)" << std::endl;
        } break;
        case method::STATUS : {
            std::cout << "Print the status of a transfer."
                "\narguments for method status:"
                "\n\t(--ticket=)<ticket id>" << std::endl;
        } break;
    }
}

void command_config (const Settler::options &p) {
    Settler::network net {p.endpoints ()};
    std::cout << net.Token.config () << std::endl;
}

void command_balance (const Settler::options &p) {
    maybe<Settler::Bitcoin::address> addr = p.address ();
    if (!bool (addr)) throw Settler::exception {Settler::failure::invalid_request, "no address provided"};

    Settler::network net {p.endpoints ()};
    Settler::token_config config = net.Token.config ();
    Settler::balance b = Settler::balance_of (net.Token.funding_sources (*addr), config.Decimals);

    std::cout << "balance of " << *addr << ": " << Settler::write_decimal (b.Amount, config.Decimals) <<
        " (" << b.Amount << " atomic units)" << std::endl;
}

namespace {
    std::atomic<bool> Cancel {false};

    void interrupt (int) {
        Cancel = true;
    }
}

void command_transfer (const Settler::options &p) {
    maybe<Settler::Bitcoin::secret> key = p.key ();
    if (!bool (key)) throw Settler::exception {Settler::failure::invalid_request, "no key provided"};

    Settler::transfer_request request = p.recipients ();
    Settler::settlement_mode mode = p.mode ();

    Settler::network net {p.endpoints ()};
    Settler::address_locks locks {};
    Settler::engine e {net.Token, net.Ordinals, net.Ordinals, locks, &std::cout};

    Settler::transfer_outcome outcome = e.transfer (key->address (), *key, request, mode);

    if (!outcome) throw outcome.error ();

    if (bool (outcome.TXID)) {
        std::cout << "Transfer complete. txid: " << Settler::write_TXID (*outcome.TXID) << std::endl;
        return;
    }

    std::cout << "Transfer submitted with ticket " << *outcome.TicketID << std::endl;

    std::signal (SIGINT, interrupt);
    try {
        Settler::transfer_status last = Settler::poll_status (net.Token, *outcome.TicketID,
            [] (const Settler::transfer_status &st) {
                std::cout << "status: " << st.Status << std::endl;
            }, &Cancel, p.polling ());

        std::cout << last << std::endl;

        if (last.Status == Settler::state::failed)
            throw Settler::exception {Settler::failure::broadcast_failed,
                string::write ("transfer failed: ", bool (last.Errors) ? *last.Errors : std::string {"no reason given"})};
    } catch (const Settler::exception &x) {
        if (x.Kind == Settler::failure::cancelled || x.Kind == Settler::failure::settlement_timeout)
            std::cout << "check on the transfer later with: status --ticket=" << *outcome.TicketID << std::endl;
        throw;
    }
}

void command_status (const Settler::options &p) {
    maybe<std::string> ticket = p.ticket ();
    if (!bool (ticket)) p.get (2, ticket);
    if (!bool (ticket)) throw Settler::exception {Settler::failure::invalid_request, "no ticket provided"};

    Settler::network net {p.endpoints ()};
    std::cout << net.Token.status (*ticket) << std::endl;
}
