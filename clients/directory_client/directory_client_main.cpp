/*
 * File: clients/directory_client/directory_client_main.cpp
 * Project: TAIS Track Relay
 * Purpose: Example HTTP consumer client (directory / facility snapshot)
 * Last updated: 2026-10-18
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

namespace http = boost::beast::http;
using json = nlohmann::json;

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::string facility;
    int repeat = 1;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--facility" && i + 1 < argc)
            facility = argv[++i];
        else if (a == "--repeat" && i + 1 < argc)
            repeat = std::stoi(argv[++i]);
        else if (a == "--pretty")
            pretty = true;
    }
    const std::string target = facility.empty() ? "/v1/tais/facilities" : "/v1/tais/facilities/" + facility;

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = base.substr(pos + 2);
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.substr(host.size() + 1);
        auto results = res.resolve(host, port);
        for (int k = 0; k < repeat; ++k)
        {
            boost::asio::ip::tcp::socket sock{ioc};
            boost::asio::connect(sock, results.begin(), results.end());
            http::request<http::string_body> req{http::verb::get, target, 11};
            req.set(http::field::host, host);
            http::write(sock, req);
            boost::beast::flat_buffer buf;
            http::response<http::string_body> res;
            http::read(sock, buf, res);

            try
            {
                auto j = nlohmann::json::parse(res.body());
                std::cout << "[directory_client] status=" << res.result_int() << " body:\n";
                std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
            }
            catch (const std::exception &e)
            {
                std::cout << "[directory_client] status=" << res.result_int()
                          << " raw body=" << res.body()
                          << " (failed to parse JSON: " << e.what() << ")" << std::endl;
            }

            boost::system::error_code ignored;
            sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
            if (k + 1 < repeat)
                std::this_thread::sleep_for(std::chrono::seconds(1));
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "directory_client error: " << e.what() << "\n";
        return 1;
    }
}
