#include <algorithm>
#include <cctype>
#include <iostream>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <stdexcept>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace fs = std::filesystem;
namespace http = boost::beast::http;

static void parse_http_url(const std::string &url, std::string &host, std::string &port)
{
    // expect http://host:port
    auto scheme_pos = url.find("://");
    auto rest = (scheme_pos == std::string::npos) ? url : url.substr(scheme_pos + 3);
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        host = hp;
        port = "80"; // default
    }
    else
    {
        host = hp.substr(0, colon);
        port = hp.substr(colon + 1);
    }
}

static std::string url_encode(const std::string &s)
{
    std::ostringstream out;
    for (unsigned char c : s)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
            out << c;
        else
            out << '%' << std::uppercase << std::hex << ((c >> 4) & 0xF) << (c & 0xF) << std::nouppercase << std::dec;
    }
    return out.str();
}

static std::string read_file(const fs::path &p)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        throw std::runtime_error("failed to open " + p.string());
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

int main(int argc, char **argv)
{
    try
    {
        std::string base = "http://localhost:8080";
        std::string topic = "TAIS/REPLAY";
        std::string dir = ".";
        int delay_ms = 200;
        bool loop = false;

        for (int i = 1; i < argc; ++i)
        {
            std::string a = argv[i];
            if (a == "--http" && i + 1 < argc)
                base = argv[++i];
            else if (a == "--topic" && i + 1 < argc)
                topic = argv[++i];
            else if (a == "--dir" && i + 1 < argc)
                dir = argv[++i];
            else if (a == "--delay-ms" && i + 1 < argc)
                delay_ms = std::stoi(argv[++i]);
            else if (a == "--loop")
                loop = true;
        }

        std::vector<fs::path> files;
        for (const auto &e : fs::directory_iterator(dir))
        {
            if (e.is_regular_file() && e.path().extension() == ".xml")
                files.push_back(e.path());
        }
        std::sort(files.begin(), files.end());
        if (files.empty())
            throw std::runtime_error("no *.xml files in " + dir);
        std::cerr << "Replaying " << files.size() << " messages from " << dir << " as " << topic << "\n";

        boost::asio::io_context ioc;
        std::string host, port;
        parse_http_url(base, host, port);
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, port);
        const std::string target = "/v1/tais/ingest?topic=" + url_encode(topic);
        size_t applied = 0;

        do
        {
            for (size_t i = 0; i < files.size(); ++i)
            {
                boost::asio::ip::tcp::socket sock{ioc};
                boost::asio::connect(sock, results.begin(), results.end());
                http::request<http::string_body> req{http::verb::post, target, 11};
                req.set(http::field::host, host);
                req.set(http::field::content_type, "application/xml");
                req.body() = read_file(files[i]);
                req.prepare_payload();
                http::write(sock, req);

                boost::beast::flat_buffer buf;
                http::response<http::string_body> resp;
                http::read(sock, buf, resp);
                auto j = json::parse(resp.body(), nullptr, false);
                if (resp.result() == http::status::ok && j.is_object())
                    applied += j.value("applied", size_t{0});
                else
                    std::cerr << files[i].filename().string() << ": status=" << resp.result_int() << " " << resp.body() << "\n";

                boost::system::error_code ignored;
                sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);

                if (i % 100 == 0 || i + 1 == files.size())
                    std::cerr << "Sent " << (i + 1) << "/" << files.size() << " (records applied " << applied << ")\n";
                std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            }
        } while (loop);
        return 0;
    }
    catch (const std::exception &e)
    {
        std::cerr << "playback error: " << e.what() << "\n";
        return 1;
    }
}
