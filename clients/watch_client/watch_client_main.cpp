#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8090/tais/ws/ZNY";
    bool verbose = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--verbose")
            verbose = true;
    }

    try
    {
        // connect WS and print incoming envelopes
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = ws_url.find("//");
        auto hp = ws_url.substr(pos + 2);
        auto slash = hp.find("/");
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.substr(host.size() + 1, slash - host.size() - 1);
        auto target = hp.substr(slash);
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(host, target);
        std::cerr << "watch: connected to " << ws_url << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object() || !j.contains("type"))
                continue;
            const auto type = j["type"].get<std::string>();
            const auto &payload = j["payload"];
            if (type == "remove")
                std::cout << "remove " << payload.value("facility", "") << "/" << payload.value("trackNum", "") << "\n";
            else
                std::cout << type << " tracks=" << payload.size() << "\n";
            if (verbose)
                std::cout << j.dump(2) << "\n";
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "watch error: " << e.what() << "\n";
        return 1;
    }
}
