#include <chrono>
#include <iostream>
#include <string>

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <rangeloader/context.hpp>
#include <rangeloader/rangeloader.hpp>
#include <rangeloader/url.hpp>
#include <rangeloader/utils.hpp>

using namespace rangeloader;

struct CommandLineOptions
{
    std::string url;
    std::string outfile;
    std::string config_file;
    std::string sha256;
    std::string chunk_size;
    int workers = -1;
    int max_redirects = -1;
    double timeout = -1;
    bool no_ranges = false;
    bool json = false;
};

std::string
default_outfile(const std::string& url)
{
    auto handler = URLHandler::parse(url);
    std::string path = handler ? handler->path() : url;
    std::string name = rsplit(path, "/", 1).back();
    return name.empty() ? "index.html" : name;
}

ClientOptions
make_client_options(const CommandLineOptions& cli)
{
    ClientOptions options;
    if (!cli.config_file.empty())
    {
        spdlog::info("Loading file {}", cli.config_file);
        YAML::Node config = YAML::LoadFile(cli.config_file);
        options = ClientOptions::from_yaml(config["client"]);
    }

    // command line flags take precedence over the configuration file
    if (cli.no_ranges)
        options.accepts_ranges = false;
    if (cli.workers >= 0)
        options.num_workers = cli.workers;
    if (!cli.chunk_size.empty())
    {
        auto size = parse_size(cli.chunk_size);
        if (!size)
            throw std::invalid_argument(fmt::format("invalid chunk size: {}", cli.chunk_size));
        options.chunk_size = size.value();
    }
    if (cli.max_redirects >= 0)
        options.max_redirects = cli.max_redirects;
    if (cli.timeout >= 0)
        options.timeout = std::chrono::milliseconds(static_cast<long long>(cli.timeout * 1000));
    return options;
}

void
load_context_config(Context& ctx, const std::string& config_file)
{
    if (config_file.empty())
        return;

    YAML::Node config = YAML::LoadFile(config_file);
    if (config["headers"])
        ctx.additional_httpheaders = config["headers"].as<std::vector<std::string>>();
    if (config["proxies"])
        ctx.proxy_map = config["proxies"].as<std::map<std::string, std::string>>();
    if (config["connect_timeout"])
        ctx.connect_timeout = config["connect_timeout"].as<long>();
    if (config["ssl_ca_info"])
        ctx.ssl_ca_info = config["ssl_ca_info"].as<std::string>();
}

int
handle_download(Client& client, const CommandLineOptions& cli)
{
    const std::string outfile = cli.outfile.empty() ? default_outfile(cli.url) : cli.outfile;

    auto downloaded = client.download_to_file(outfile, cli.url);
    if (!downloaded)
    {
        downloaded.error().log();
        return 1;
    }

    if (!cli.sha256.empty())
    {
        const auto actual = sha256sum(outfile);
        if (actual != to_lower(cli.sha256))
        {
            DownloadError{ ErrorLevel::FATAL,
                           ErrorCode::RL_BADCHECKSUM,
                           fmt::format("SHA256 mismatch for {}: expected {}, got {}",
                                       outfile,
                                       cli.sha256,
                                       actual) }
                .log();
            return 1;
        }
    }

    std::cout << "Downloaded " << cli.url << " to " << outfile << std::endl;
    return 0;
}

int
handle_get(Client& client, const CommandLineOptions& cli)
{
    auto bytes = client.download_to_bytes({}, cli.url);
    if (!bytes)
    {
        bytes.error().log();
        return 1;
    }

    Response response;
    response.content.assign(bytes->begin(), bytes->end());
    if (cli.json)
    {
        try
        {
            std::cout << response.json().dump(4) << std::endl;
        }
        catch (const nlohmann::json::exception&)
        {
            return 1;
        }
    }
    else
    {
        std::cout << response.content << std::endl;
    }
    return 0;
}

int
handle_head(Client& client, const CommandLineOptions& cli)
{
    const auto metadata = client.probe_headers(cli.url);
    std::cout << "content-length: " << metadata.content_length << "\n"
              << "accepts-ranges: " << (metadata.accepts_ranges ? "yes" : "no") << std::endl;
    return 0;
}

int
main(int argc, char** argv)
{
    CLI::App app{ "rangeloader - parallel ranged HTTP downloads" };
    app.require_subcommand(1);

    CommandLineOptions cli;
    bool verbose = false;
    bool disable_ssl = false;

    CLI::App* s_dl = app.add_subcommand("download", "Download a file");
    s_dl->add_option("url", cli.url, "URL to download")->required();
    s_dl->add_option("-o", cli.outfile, "Output file");
    s_dl->add_option("--sha256", cli.sha256, "Expected SHA256 of the downloaded file");

    CLI::App* s_get = app.add_subcommand("get", "Download into memory and print the body");
    s_get->add_option("url", cli.url, "URL to fetch")->required();
    s_get->add_flag("--json", cli.json, "Pretty print the body as JSON");

    CLI::App* s_head = app.add_subcommand("head", "Print length and range support of a URL");
    s_head->add_option("url", cli.url, "URL to query")->required();

    for (CLI::App* sub : { s_dl, s_get, s_head })
    {
        sub->add_option("-f", cli.config_file, "YAML configuration file");
        sub->add_option("-w,--workers", cli.workers, "Number of parallel workers");
        sub->add_option("-c,--chunk-size", cli.chunk_size, "Chunk size (e.g. 1048576, 512K, 10M)");
        sub->add_option("--max-redirects", cli.max_redirects, "Max number of redirects to follow");
        sub->add_option("--timeout", cli.timeout, "Time budget in seconds (0 for none)");
        sub->add_flag("--no-ranges", cli.no_ranges, "Never download in parallel chunks");
        sub->add_flag("-k", disable_ssl, "Disable SSL verification");
        sub->add_flag("-v", verbose, "Enable verbose output");
    }

    CLI11_PARSE(app, argc, argv);

    try
    {
        rangeloader::Context ctx;
        ctx.set_verbosity(verbose ? 1 : 0);
        if (!verbose)
        {
            // errors are still worth reporting
            ctx.set_log_level(spdlog::level::err);
        }
        ctx.disable_ssl = disable_ssl;
        load_context_config(ctx, cli.config_file);

        CurlTransport transport(ctx);
        Client client(transport, make_client_options(cli));

        if (app.got_subcommand(s_dl))
        {
            return handle_download(client, cli);
        }
        if (app.got_subcommand(s_get))
        {
            return handle_get(client, cli);
        }
        if (app.got_subcommand(s_head))
        {
            return handle_head(client, cli);
        }
    }
    catch (const YAML::Exception& e)
    {
        spdlog::critical("Invalid configuration file: {}", e.what());
        return 1;
    }
    catch (const std::exception& e)
    {
        spdlog::critical("{}", e.what());
        return 1;
    }

    return 0;
}
