#include <algorithm>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "holysheet/catalog/catalog.hpp"
#include "holysheet/catalog/memory_store.hpp"
#include "holysheet/client/exchange_log.hpp"
#include "holysheet/client/session.hpp"
#include "holysheet/crypto.hpp"
#include "holysheet/protocol.hpp"
#include "holysheet/server/config.hpp"
#include "holysheet/server/dispatcher.hpp"
#include "holysheet/server/receiver_registry.hpp"
#include "holysheet/server/server.hpp"
#include "holysheet/server/session.hpp"

using namespace holysheet;
using namespace holysheet::server;

namespace
{

    catalog::RemoteItem seed_upload(catalog::MemoryStore &store, std::string name, std::string path)
    {
        catalog::RemoteItem item;
        item.name = std::move(name);
        item.kind = catalog::ItemKind::Folder;
        item.properties = {{"directParent", "true"}, {"path", std::move(path)}};
        return store.insert(std::move(item));
    }

    const protocol::ErrorDetail &error_detail(const protocol::Message &message)
    {
        assert(protocol::type_of(message) == protocol::PayloadType::Error);
        return std::get<protocol::ErrorDetail>(message.body);
    }

    const std::vector<protocol::ListItem> &items_of(const protocol::Message &message)
    {
        assert(protocol::type_of(message) == protocol::PayloadType::ListResponse);
        return std::get<protocol::ListResponse>(message.body).items;
    }

    void test_dispatch_list_request()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        seed_upload(store, "root-upload", "/");
        seed_upload(store, "nested-upload", "/nested/");
        Dispatcher dispatcher(catalog);

        const auto response = dispatcher.dispatch(R"({"code":1,"type":"LIST_REQUEST","state":"abc","query":"foo"})");
        assert(response.has_value());
        assert(response->code == 1);
        assert(response->state == "abc");
        assert(response->message == "Success");
        const auto &items = items_of(*response);
        assert(items.size() == 1);
        assert(items[0].name == "root-upload");
        assert(items[0].kind_code == 1);

        const auto nested = dispatcher.dispatch(R"({"code":5,"type":"LIST_REQUEST","state":"n","query":"/nested/"})");
        assert(nested.has_value());
        assert(items_of(*nested).size() == 1);
        assert(items_of(*nested)[0].name == "nested-upload");
    }

    void test_dispatch_drops_unsuccessful_codes()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        Dispatcher dispatcher(catalog);

        assert(!dispatcher.dispatch(R"({"code":0,"type":"LIST_REQUEST","state":"x"})").has_value());
        assert(!dispatcher.dispatch(R"({"code":-3,"type":"LIST_REQUEST","state":"x"})").has_value());
        assert(!dispatcher.dispatch(R"({"type":"LIST_REQUEST","state":"x"})").has_value());
        assert(!dispatcher.dispatch(R"({"code":0,"type":"NOT_A_TYPE","state":"x"})").has_value());

        // Dropped even when the rest of the envelope has the wrong JSON types.
        assert(!dispatcher.dispatch(R"({"code":0,"type":"LIST_REQUEST","state":"x","message":5})").has_value());
        assert(!dispatcher.dispatch(R"({"code":0,"type":7,"state":"x"})").has_value());
        assert(!dispatcher.dispatch(R"({"code":-1,"type":"LIST_REQUEST","state":123})").has_value());
        assert(!dispatcher.dispatch(R"({"code":null,"type":[],"state":{}})").has_value());
        assert(!dispatcher.dispatch(R"({"code":0.5,"type":"LIST_REQUEST","state":"x"})").has_value());
        assert(!dispatcher.dispatch(R"({"code":-1e300,"type":"LIST_REQUEST","state":"x"})").has_value());
        assert(store.list_calls() == 0);

        for (const auto *line : {R"({"code":1.9,"type":"LIST_REQUEST","state":"f"})",
                                 R"({"code":1e300,"type":"LIST_REQUEST","state":"f"})",
                                 R"({"code":"1","type":"LIST_REQUEST","state":"f"})"})
        {
            const auto response = dispatcher.dispatch(line);
            assert(response.has_value());
            assert(protocol::type_of(*response) == protocol::PayloadType::Error);
            assert(response->state == "f");
        }
        assert(store.list_calls() == 0);
    }

    void test_dispatch_rejections()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        Dispatcher dispatcher(catalog);

        const auto malformed = dispatcher.dispatch("{not json");
        assert(malformed.has_value());
        assert(malformed->code == protocol::kFailureCode);
        assert(!malformed->message.empty());
        assert(malformed->state.empty());
        assert(error_detail(*malformed).stack_trace.find("invalid_payload") != std::string::npos);

        const auto array = dispatcher.dispatch("[1,2]");
        assert(array.has_value());
        assert(protocol::type_of(*array) == protocol::PayloadType::Error);

        const auto wrong_type = dispatcher.dispatch(R"({"code":"1","type":"LIST_REQUEST","state":"w"})");
        assert(wrong_type.has_value());
        assert(wrong_type->state == "w");
        assert(protocol::type_of(*wrong_type) == protocol::PayloadType::Error);

        const auto unknown = dispatcher.dispatch(R"({"code":1,"type":"UPLOAD","state":"u"})");
        assert(unknown.has_value());
        assert(unknown->state == "u");
        assert(unknown->message == "Unknown payload type: 'UPLOAD'");

        const auto unreceivable = dispatcher.dispatch(R"({"code":1,"type":"LIST_RESPONSE","state":"st","items":[]})");
        assert(unreceivable.has_value());
        assert(unreceivable->state == "st");
        assert(unreceivable->message == "Received unreceivable payload type: LIST_RESPONSE");
        assert(error_detail(*unreceivable).stack_trace.find("not_receivable") != std::string::npos);

        const auto bad_body = dispatcher.dispatch(R"({"code":1,"type":"LIST_REQUEST","state":"q","query":5})");
        assert(bad_body.has_value());
        assert(bad_body->state == "q");
        assert(protocol::type_of(*bad_body) == protocol::PayloadType::Error);

        assert(store.list_calls() == 0);
    }

    void test_dispatch_degrades_on_store_failure()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        seed_upload(store, "root-upload", "/");
        Dispatcher dispatcher(catalog);

        store.fail_requests(ErrorCode::Service);
        const auto response = dispatcher.dispatch(R"({"code":1,"type":"LIST_REQUEST","state":"s","query":"/"})");
        assert(response.has_value());
        assert(response->state == "s");
        assert(items_of(*response).empty());
    }

    void test_list_item_conversion()
    {
        catalog::RemoteItem item;
        item.id = "abc123";
        item.name = "ledger";
        item.kind = catalog::ItemKind::Document;
        item.size = 77;
        item.modified_time_ms = 1600000000123;

        auto entry = to_list_item(item);
        assert(entry.name == "ledger");
        assert(entry.kind_code == 2);
        assert(entry.size == 77);
        assert(entry.modified_at_millis == 1600000000123);
        assert(entry.content_hash == crypto::hash_string("abc123"));

        item.content_hash = "md5sum";
        assert(to_list_item(item).content_hash == "md5sum");

        const auto message = to_error_message(Failure{ErrorCode::Service, "", "trace"}, "st");
        assert(message.message == "service");
        assert(message.state == "st");
        assert(error_detail(message).stack_trace == "trace");
    }

    void test_receiver_registry_rejects_empty()
    {
        ReceiverRegistry registry;
        bool threw = false;
        try
        {
            registry.add(LineReceiver{});
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
        registry.add([](Session &, const std::string &) {});
        assert(registry.size() == 1);
    }

    class RunningServer
    {
    public:
        RunningServer(catalog::Catalog &catalog, ServerConfig config) : server_(std::move(config), catalog) {}

        ~RunningServer()
        {
            server_.stop();
            if (runner_.joinable())
            {
                runner_.join();
            }
        }

        void start()
        {
            runner_ = std::thread([this]
                                  { server_.run(); });
        }

        Server &server() { return server_; }

        std::unique_ptr<client::ClientSession> connect(const std::optional<std::filesystem::path> &log_path = std::nullopt)
        {
            client::ClientConfig config;
            config.host = "127.0.0.1";
            config.port = server_.port();
            auto session = std::make_unique<client::ClientSession>(std::move(config), client::ExchangeLog(log_path));
            session->connect();
            return session;
        }

    private:
        Server server_;
        std::thread runner_;
    };

    ServerConfig test_config()
    {
        ServerConfig config;
        config.port = 0;
        config.worker_threads = 2;
        config.dispatch_threads = 3;
        config.handle_signals = false;
        return config;
    }

    void test_end_to_end_exchange()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        seed_upload(store, "root-upload", "/");

        std::mutex seen_mutex;
        std::vector<std::string> seen;
        std::vector<std::string> peers;

        RunningServer running(catalog, test_config());
        running.server().add_receiver([&seen_mutex, &seen, &peers](Session &session, const std::string &line)
                                      {
            std::lock_guard<std::mutex> lock(seen_mutex);
            seen.push_back(line);
            peers.push_back(session.remote_endpoint()); });
        running.server().add_receiver([](Session &, const std::string &)
                                      { throw std::runtime_error("receiver failure"); });
        running.start();

        auto client = running.connect();

        const auto first = client->list("foo", "abc");
        assert(first.state == "abc");
        assert(first.code == 1);
        assert(items_of(first).size() == 1);

        // A dropped request leaves nothing on the wire, so the next line read answers the follow-up.
        client->send_line(R"({"code":0,"type":"LIST_REQUEST","state":"x"})");
        client->send(protocol::make_list_request("/", "after"));
        const auto after = client->read_message();
        assert(after.state == "after");
        assert(protocol::type_of(after) == protocol::PayloadType::ListResponse);

        client->send_line("this is not json");
        const auto error = client->read_message();
        assert(protocol::type_of(error) == protocol::PayloadType::Error);
        assert(!error.message.empty());
        assert(error.state.empty());

        client->send_line(R"({"code":1,"type":"ERROR","state":"nr","stackTrace":""})");
        const auto rejected = client->read_message();
        assert(rejected.state == "nr");
        assert(rejected.message == "Received unreceivable payload type: ERROR");

        client->send_line("\r\n   \n");
        const auto still_alive = client->list("/", "still-alive");
        assert(still_alive.state == "still-alive");

        {
            std::lock_guard<std::mutex> lock(seen_mutex);
            assert(std::find(seen.begin(), seen.end(),
                             R"({"code":0,"type":"LIST_REQUEST","state":"x"})") != seen.end());
            assert(std::find(seen.begin(), seen.end(), "this is not json") != seen.end());
            assert(std::none_of(seen.begin(), seen.end(), [](const std::string &line)
                                { return line.find_first_not_of(" \r") == std::string::npos; }));
            assert(!peers.empty());
            assert(std::all_of(peers.begin(), peers.end(), [](const std::string &peer)
                               { return peer.rfind("127.0.0.1:", 0) == 0; }));
        }
        client->close();
    }

    void test_concurrent_requests_correlate_by_state()
    {
        catalog::MemoryStore store;
        store.set_latency(std::chrono::milliseconds(5));
        catalog::Catalog catalog(store);
        seed_upload(store, "root-upload", "/");

        RunningServer running(catalog, test_config());
        running.start();
        auto client = running.connect();

        std::set<std::string> expected;
        for (int i = 0; i < 6; ++i)
        {
            const auto state = "s" + std::to_string(i);
            expected.insert(state);
            client->send(protocol::make_list_request("/", state));
        }

        std::set<std::string> answered;
        for (int i = 0; i < 6; ++i)
        {
            const auto response = client->read_message();
            assert(items_of(response).size() == 1);
            answered.insert(response.state);
        }
        assert(answered == expected);
        client->close();
    }

    void test_client_exchange_log()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        seed_upload(store, "logged-upload", "/");
        RunningServer running(catalog, test_config());
        running.start();

        const auto log_path = std::filesystem::temp_directory_path() /
                              ("holysheet-exchange-" + crypto::random_id(8) + ".log");
        {
            auto client = running.connect(log_path);
            const auto response = client->list("/", "log-1");
            assert(response.state == "log-1");
            assert(client->exchange_log().outstanding() == 0);
            client->close();
        }

        std::ifstream in(log_path);
        assert(in);
        const std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        in.close();
        std::filesystem::remove(log_path);

        assert(contents.find("connected to 127.0.0.1:") != std::string::npos);
        assert(contents.find("state=log-1 sent LIST_REQUEST query='/'") != std::string::npos);
        assert(contents.find("state=log-1 received LIST_RESPONSE code=1 items=1 after ") != std::string::npos);
        assert(contents.find("disconnected, 0 request(s) unanswered") != std::string::npos);

        client::ExchangeLog silent(std::nullopt);
        silent.request_sent(protocol::make_list_request("/", "a"));
        assert(silent.outstanding() == 1);
        silent.response_received(protocol::make_list_response("b", {}));
        assert(silent.outstanding() == 1);
        silent.response_received(protocol::make_list_response("a", {}));
        assert(silent.outstanding() == 0);
    }

    void test_receiver_can_push_to_session()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);

        RunningServer running(catalog, test_config());
        running.server().add_receiver([](Session &session, const std::string &line)
                                      {
            if (line.find("push-me") != std::string::npos)
            {
                session.send(protocol::make_list_response("pushed", {}));
            } });
        running.start();
        auto client = running.connect();

        client->send(protocol::make_list_request("/", "push-me"));
        std::set<std::string> states;
        states.insert(client->read_message().state);
        states.insert(client->read_message().state);
        assert(states == (std::set<std::string>{"pushed", "push-me"}));
        client->close();
    }

    void test_final_line_without_newline()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);

        RunningServer running(catalog, test_config());
        running.start();

        asio::io_context io_context;
        asio::ip::tcp::socket socket(io_context);
        socket.connect(asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), running.server().port()));
        const std::string request = R"({"code":1,"type":"LIST_REQUEST","state":"tail","query":"/"})";
        asio::write(socket, asio::buffer(request));
        socket.shutdown(asio::ip::tcp::socket::shutdown_send);

        std::string buffer;
        asio::read_until(socket, asio::dynamic_buffer(buffer), '\n');
        const auto response = nlohmann::json::parse(buffer.substr(0, buffer.find('\n'))).get<protocol::Message>();
        assert(response.state == "tail");
        assert(protocol::type_of(response) == protocol::PayloadType::ListResponse);
    }

    void test_bind_conflict_throws()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        Server first(test_config(), catalog);

        auto config = test_config();
        config.port = first.port();
        bool threw = false;
        try
        {
            Server second(config, catalog);
        }
        catch (const std::system_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_parse_port()
    {
        assert(parse_port("4567") == 4567);
        assert(parse_port("0") == 0);
        assert(parse_port("65535") == 65535);

        for (const auto *text : {"70000", "65536", "-1", "12ab", "", "port"})
        {
            bool threw = false;
            try
            {
                (void)parse_port(text);
            }
            catch (const std::logic_error &)
            {
                threw = true;
            }
            assert(threw);
        }
    }

    void test_stop_is_safe_around_run()
    {
        catalog::MemoryStore store;
        catalog::Catalog catalog(store);
        {
            Server server(test_config(), catalog);
            server.stop();
            // The queued stop ends the loop as soon as it starts.
            server.run();
        }
        for (int i = 0; i < 20; ++i)
        {
            Server server(test_config(), catalog);
            std::thread runner([&server]
                               { server.run(); });
            server.stop();
            runner.join();
        }
    }

} // namespace

void run_server_component_tests()
{
    test_dispatch_list_request();
    test_dispatch_drops_unsuccessful_codes();
    test_dispatch_rejections();
    test_dispatch_degrades_on_store_failure();
    test_list_item_conversion();
    test_receiver_registry_rejects_empty();
    test_end_to_end_exchange();
    test_concurrent_requests_correlate_by_state();
    test_client_exchange_log();
    test_receiver_can_push_to_session();
    test_final_line_without_newline();
    test_bind_conflict_throws();
    test_parse_port();
    test_stop_is_safe_around_run();
}
