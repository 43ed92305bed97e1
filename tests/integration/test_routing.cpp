#include "../framework/RecordingSurface.hpp"
#include "../framework/SimpleTest.hpp"
#include "bar/Bar.hpp"
#include "bar/EventRouter.hpp"
#include "ipc/IpcClient.hpp"
#include "ipc/IpcServer.hpp"
#include <chrono>
#include <cstring>
#include <filesystem>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <sys/un.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace lazybar;
using namespace lazybar::bar;
using lazybar::test::RecordingSurface;

namespace {

constexpr int WIDTH = 400;
constexpr int HEIGHT = 20;

PanelDrawInfo sized(int width) {
    PanelDrawInfo info;
    info.width = width;
    info.height = HEIGHT;
    return info;
}

Panel interactive(const std::string& name, int width) {
    Panel panel(name, true, runtime::Channel<Event>::create());
    panel.draw_info = sized(width);
    return panel;
}

Panel passive(const std::string& name, int width) {
    Panel panel(name, true);
    panel.draw_info = sized(width);
    return panel;
}

BarSettings settings(bool reverse_scroll = false) {
    BarSettings s;
    s.name = "routing";
    s.width = WIDTH;
    s.height = HEIGHT;
    s.margins = Margins{0, 0, 0};
    s.reverse_scroll = reverse_scroll;
    return s;
}

class FakeWindow : public WindowControl {
public:
    void map() override { mapped = true; }
    void unmap() override { mapped = false; }
    bool is_mapped() const override { return mapped; }

    bool mapped = true;
};

PointerPress press_at(int button, int x, int y = 3) {
    PointerPress press;
    press.button = button;
    press.event_x = x;
    press.event_y = y;
    return press;
}

std::optional<Event> next_event(const Panel& panel) {
    return panel.events->try_receive();
}

std::filesystem::path test_socket_path(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("lazybar-test-" + std::to_string(::getpid())) / name;
}

// Polls the server the way the bar's loop does until a message arrives.
std::optional<ipc::IpcConnection> wait_for_message(ipc::IpcServer& server, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        std::vector<pollfd> fds = {{server.fd(), POLLIN, 0}};
        for (int client_fd : server.client_fds()) {
            fds.push_back({client_fd, POLLIN, 0});
        }
        if (::poll(fds.data(), static_cast<nfds_t>(fds.size()), 50) <= 0) continue;

        for (size_t i = 1; i < fds.size(); ++i) {
            if (fds[i].revents == 0) continue;
            if (auto connection = server.read_message(fds[i].fd)) return connection;
        }
        if (fds[0].revents & POLLIN) server.accept_clients();
    }
    return std::nullopt;
}

int connect_silently(const std::filesystem::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    std::string raw = path.string();
    std::memcpy(addr.sun_path, raw.c_str(), raw.size() + 1);
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return -1;
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        ::close(fd);
        return -1;
    }
    return fd;
}

bool wait_for_clients(ipc::IpcServer& server, size_t count) {
    for (int attempt = 0; attempt < 40 && server.client_fds().size() < count; ++attempt) {
        pollfd pfd{server.fd(), POLLIN, 0};
        if (::poll(&pfd, 1, 50) > 0) server.accept_clients();
    }
    return server.client_fds().size() == count;
}

}  // namespace

TEST_CASE(test_button_codes_map_to_logical_buttons) {
    ASSERT_TRUE(EventRouter::translate_button(1, false) == MouseButton::Left);
    ASSERT_TRUE(EventRouter::translate_button(2, false) == MouseButton::Middle);
    ASSERT_TRUE(EventRouter::translate_button(3, false) == MouseButton::Right);
    ASSERT_TRUE(EventRouter::translate_button(4, false) == MouseButton::ScrollDown);
    ASSERT_TRUE(EventRouter::translate_button(5, false) == MouseButton::ScrollUp);
    ASSERT_TRUE(EventRouter::translate_button(4, true) == MouseButton::ScrollUp);
    ASSERT_TRUE(EventRouter::translate_button(5, true) == MouseButton::ScrollDown);
    ASSERT_FALSE(EventRouter::translate_button(8, false).has_value());
}

TEST_CASE(test_click_reaches_panel_under_pointer) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Left, {interactive("P0", 50), interactive("P1", 30)});
    bar.redraw_bar();

    EventRouter router(bar);
    ASSERT_TRUE(router.route_button(press_at(1, 55, 7)));

    ASSERT_FALSE(next_event(bar.panels(Alignment::Left)[0]).has_value());
    auto event = next_event(bar.panels(Alignment::Left)[1]);
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->type == Event::Type::Mouse);
    ASSERT_TRUE(event->mouse.button == MouseButton::Left);
    ASSERT_EQ(event->mouse.x, 5);
    ASSERT_EQ(event->mouse.y, 7);
    ASSERT_FALSE(event->expects_reply());
}

TEST_CASE(test_click_outside_panels_or_on_passive_panel_is_dropped) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Left, {passive("label", 40)});
    bar.set_panels(Alignment::Right, {interactive("clock", 60)});
    bar.redraw_bar();

    EventRouter router(bar);
    ASSERT_FALSE(router.route_button(press_at(1, 10)));
    ASSERT_FALSE(router.route_button(press_at(1, 200)));
    ASSERT_FALSE(router.route_button(press_at(9, 350)));

    ASSERT_TRUE(router.route_button(press_at(4, 350)));
    auto event = next_event(bar.panels(Alignment::Right)[0]);
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->mouse.button == MouseButton::ScrollDown);
    ASSERT_EQ(event->mouse.x, 10);
}

TEST_CASE(test_reverse_scroll_swaps_wheel_direction) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(true), surface);
    bar.set_panels(Alignment::Center, {interactive("volume", 40)});
    bar.redraw_bar();

    EventRouter router(bar);
    ASSERT_TRUE(router.route_button(press_at(4, 200)));
    auto event = next_event(bar.panels(Alignment::Center)[0]);
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->mouse.button == MouseButton::ScrollUp);
}

TEST_CASE(test_hidden_panel_does_not_take_clicks) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Left, {interactive("a", 50), interactive("b", 50)});
    bar.redraw_bar();
    ASSERT_TRUE(bar.set_panel_visible(Alignment::Left, 0, false));

    EventRouter router(bar);
    auto hit = router.hit_test(10);
    ASSERT_TRUE(hit.has_value());
    ASSERT_EQ(hit->index, 1u);
    ASSERT_FALSE(router.hit_test(60).has_value());
}

TEST_CASE(test_message_errors_are_reported_to_caller) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Left, {interactive("dup", 10), passive("label", 10)});
    bar.set_panels(Alignment::Right, {interactive("dup", 10)});
    bar.redraw_bar();

    EventRouter router(bar);

    auto missing = router.route_message("battery.refresh");
    ASSERT_TRUE(missing.kind == MessageOutcome::Kind::Immediate);
    ASSERT_FALSE(missing.response.ok);
    ASSERT_EQ(missing.response.reason, std::string("No panel with name battery was found"));

    auto ambiguous = router.route_message("dup.cycle");
    ASSERT_FALSE(ambiguous.response.ok);
    ASSERT_TRUE(ambiguous.response.reason.find("ambiguous") != std::string::npos);

    auto passive_panel = router.route_message("label.cycle");
    ASSERT_FALSE(passive_panel.response.ok);
    ASSERT_TRUE(passive_panel.response.reason.find("not messageable") != std::string::npos);

    auto garbage = router.route_message("dance");
    ASSERT_FALSE(garbage.response.ok);

    // Without a window the bar cannot be mapped
    auto show = router.route_message("show");
    ASSERT_FALSE(show.response.ok);
}

TEST_CASE(test_quit_message) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    EventRouter router(bar);
    ASSERT_TRUE(router.route_message("quit\n").kind == MessageOutcome::Kind::Quit);
}

TEST_CASE(test_bar_visibility_messages_drive_window) {
    RecordingSurface surface(WIDTH, HEIGHT);
    FakeWindow window;
    Bar bar(settings(), surface, &window);
    EventRouter router(bar);

    ASSERT_TRUE(router.route_message("hide").response.ok);
    ASSERT_FALSE(window.mapped);
    ASSERT_TRUE(router.route_message("toggle").response.ok);
    ASSERT_TRUE(window.mapped);
    ASSERT_TRUE(router.route_message("show").response.ok);
    ASSERT_TRUE(window.mapped);
}

TEST_CASE(test_panel_toggle_by_position) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Left, {passive("a", 30), passive("b", 20)});
    bar.redraw_bar();
    ASSERT_NEAR(bar.extents().left, 50.0, 1e-9);

    EventRouter router(bar);
    ASSERT_TRUE(router.route_message("#l0.hide").response.ok);
    ASSERT_FALSE(bar.panels(Alignment::Left)[0].visible);
    ASSERT_NEAR(bar.extents().left, 20.0, 1e-9);
    ASSERT_NEAR(bar.panels(Alignment::Left)[1].x, 0.0, 1e-9);

    ASSERT_TRUE(router.route_message("#l0.toggle").response.ok);
    ASSERT_TRUE(bar.panels(Alignment::Left)[0].visible);

    ASSERT_FALSE(router.route_message("#l7.hide").response.ok);
    ASSERT_FALSE(router.route_message("#x0.hide").response.ok);
    ASSERT_FALSE(router.route_message("#l0.explode").response.ok);
}

TEST_CASE(test_action_waits_for_panel_reply) {
    RecordingSurface surface(WIDTH, HEIGHT);
    Bar bar(settings(), surface);
    bar.set_panels(Alignment::Right, {interactive("clock", 60)});
    bar.redraw_bar();

    EventRouter router(bar);
    auto outcome = router.route_message("clock.cycle");
    ASSERT_TRUE(outcome.kind == MessageOutcome::Kind::Pending);
    ASSERT_EQ(outcome.panel_name, std::string("clock"));

    auto event = next_event(bar.panels(Alignment::Right)[0]);
    ASSERT_TRUE(event.has_value());
    ASSERT_TRUE(event->type == Event::Type::Action);
    ASSERT_EQ(event->action, std::string("cycle"));
    ASSERT_TRUE(event->expects_reply());

    std::thread panel_side([action = std::move(*event)]() { action.respond(EventResponse::success()); });
    auto status = outcome.reply.wait_for(std::chrono::seconds(5));
    panel_side.join();
    ASSERT_TRUE(status == std::future_status::ready);
    ASSERT_TRUE(outcome.reply.get().ok);
}

TEST_CASE(test_response_json_shape) {
    ASSERT_EQ(EventResponse::success().to_json(), std::string("{\"success\":\"true\"}"));
    ASSERT_EQ(EventResponse::failure("nope").to_json(), std::string("{\"success\":\"false\",\"reason\":\"nope\"}"));

    auto parsed = ipc::parse_response("{\"success\":\"false\",\"reason\":\"Unknown event x\"}");
    ASSERT_TRUE(parsed.has_value());
    ASSERT_FALSE(parsed->ok);
    ASSERT_EQ(parsed->reason, std::string("Unknown event x"));
    ASSERT_FALSE(ipc::parse_response("not json").has_value());
    ASSERT_FALSE(ipc::parse_response("{\"success\":true}").has_value());
}

TEST_CASE(test_socket_round_trip) {
    auto path = test_socket_path("roundtrip");
    ipc::IpcServer server(path);
    ASSERT_TRUE(server.init());
    ASSERT_TRUE(ipc::socket_is_live(path));

    // A second bar may not steal a live socket
    ipc::IpcServer rival(path);
    ASSERT_FALSE(rival.init());

    std::optional<std::string> raw;
    std::thread client([&raw, path]() { raw = ipc::send_message(path, "clock.cycle", std::chrono::seconds(5)); });

    auto connection = wait_for_message(server, std::chrono::seconds(5));
    ASSERT_TRUE(connection.has_value());
    ASSERT_EQ(connection->message(), std::string("clock.cycle"));
    ASSERT_TRUE(connection->respond(EventResponse::failure("Unknown event cycle")));
    client.join();

    ASSERT_TRUE(raw.has_value());
    auto response = ipc::parse_response(*raw);
    ASSERT_TRUE(response.has_value());
    ASSERT_FALSE(response->ok);
    ASSERT_EQ(response->reason, std::string("Unknown event cycle"));

    server.remove_socket();
    ASSERT_FALSE(std::filesystem::exists(path));
    std::error_code ec;
    std::filesystem::remove_all(path.parent_path(), ec);
}

TEST_CASE(test_silent_client_does_not_stall_the_server) {
    auto path = test_socket_path("silent");
    ipc::IpcServer server(path, std::chrono::milliseconds(100));
    ASSERT_TRUE(server.init());

    int silent = connect_silently(path);
    ASSERT_TRUE(silent >= 0);
    ASSERT_TRUE(wait_for_clients(server, 1));
    int waiting_fd = server.client_fds()[0];

    // Nothing to read yet: the call returns at once and the client keeps waiting
    auto begin = std::chrono::steady_clock::now();
    ASSERT_FALSE(server.read_message(waiting_fd).has_value());
    ASSERT_TRUE(std::chrono::steady_clock::now() - begin < std::chrono::milliseconds(50));
    ASSERT_EQ(server.client_fds().size(), 1u);

    auto drop_in = server.time_until_next_drop();
    ASSERT_TRUE(drop_in.has_value());
    ASSERT_TRUE(*drop_in <= std::chrono::milliseconds(100));

    // A client that hangs up without a message is forgotten once read
    int hangup = connect_silently(path);
    ASSERT_TRUE(hangup >= 0);
    ::close(hangup);
    ASSERT_TRUE(wait_for_clients(server, 2));
    int hangup_fd = server.client_fds()[1];
    pollfd pfd{hangup_fd, POLLIN, 0};
    ASSERT_EQ(::poll(&pfd, 1, 1000), 1);
    ASSERT_FALSE(server.read_message(hangup_fd).has_value());
    ASSERT_EQ(server.client_fds().size(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    server.drop_silent_clients();
    ASSERT_TRUE(server.client_fds().empty());
    ASSERT_FALSE(server.time_until_next_drop().has_value());

    ::close(silent);
    server.remove_socket();
    std::error_code ec;
    std::filesystem::remove_all(path.parent_path(), ec);
}

int main() {
    return lazybar::test::TestRunner::instance().run_all();
}
