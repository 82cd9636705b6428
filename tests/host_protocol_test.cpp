#include <gtest/gtest.h>

#include "host_protocol.hpp"
#include "plugin_entry.hpp"

using namespace tpws;
using nlohmann::json;

TEST(HostProtocolTest, PairMessageCarriesPluginId)
{
    json pair = host::make_pair_message(s_plugin_id);

    EXPECT_EQ("pair", pair["type"].get<std::string>());
    EXPECT_EQ(s_plugin_id, pair["id"].get<std::string>());
}

TEST(HostProtocolTest, InfoBecomesConnectEvent)
{
    json message = json::parse(R"({
        "type": "info",
        "sdkVersion": 3,
        "tpVersionString": "3.1.10.0.0",
        "tpVersionCode": 301010,
        "pluginVersion": 100,
        "settings": [ { "Example Setting": "stored value" } ]
    })");

    auto event = host::decode_message(message, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    const auto* connected = std::get_if<host::connect_event>(&*event);
    ASSERT_NE(nullptr, connected);
    EXPECT_EQ("3.1.10.0.0", connected->tp_version);
    EXPECT_EQ(301010, connected->tp_version_code);
    EXPECT_EQ(3, connected->sdk_version);
    EXPECT_EQ("100", connected->plugin_version);
    ASSERT_EQ(1u, connected->settings.size());
    EXPECT_EQ("stored value", connected->settings.at("Example Setting"));
}

TEST(HostProtocolTest, InfoWithoutVersionsUsesPlaceholders)
{
    auto event = host::decode_message(json{ { "type", "info" } }, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    const auto& connected = std::get<host::connect_event>(*event);
    EXPECT_EQ("?", connected.tp_version);
    EXPECT_EQ("?", connected.plugin_version);
    EXPECT_TRUE(connected.settings.empty());
}

TEST(HostProtocolTest, SettingsBecomeSettingUpdateEvent)
{
    json message = json::parse(R"({
        "type": "settings",
        "values": [ { "Example Setting": "a" }, { "Other": "b" } ]
    })");

    auto event = host::decode_message(message, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    const auto& update = std::get<host::setting_update_event>(*event);
    host::settings_map expected = { { "Example Setting", "a" }, { "Other", "b" } };
    EXPECT_EQ(expected, update.values);
}

TEST(HostProtocolTest, ActionKeepsDataInOrder)
{
    json message = json::parse(R"({
        "type": "action",
        "pluginId": "tp.plugin.websockets.python",
        "actionId": "tp.plugin.websockets.python.act.sendmessage",
        "data": [
            { "id": "tp.plugin.websockets.python.act.sendmessage.data.destination", "value": "ws://localhost:9000" },
            { "id": "tp.plugin.websockets.python.act.sendmessage.data.message", "value": "hello" }
        ]
    })");

    auto event = host::decode_message(message, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    const auto& action = std::get<host::action_event>(*event);
    EXPECT_EQ(actions::s_send_message, action.action_id);
    ASSERT_EQ(2u, action.data.size());
    EXPECT_EQ(actions::s_send_message_destination, action.data[0].id);
    EXPECT_EQ("ws://localhost:9000", action.data[0].value);
    EXPECT_EQ(actions::s_send_message_message, action.data[1].id);
    EXPECT_EQ("hello", action.data[1].value);
}

TEST(HostProtocolTest, ActionWithoutDataOrIdDecodesEmpty)
{
    auto event = host::decode_message(json{ { "type", "action" } }, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    const auto& action = std::get<host::action_event>(*event);
    EXPECT_TRUE(action.action_id.empty());
    EXPECT_TRUE(action.data.empty());
}

TEST(HostProtocolTest, ClosePluginBecomesShutdownEvent)
{
    json message = { { "type", "closePlugin" }, { "pluginId", s_plugin_id } };

    auto event = host::decode_message(message, s_plugin_id);

    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(std::holds_alternative<host::shutdown_event>(*event));
}

TEST(HostProtocolTest, MessagesForOtherPluginsAreDropped)
{
    json message = { { "type", "closePlugin" }, { "pluginId", "some.other.plugin" } };

    EXPECT_FALSE(host::decode_message(message, s_plugin_id).has_value());
    EXPECT_TRUE(host::decode_message(message, "").has_value());
}

TEST(HostProtocolTest, UnhandledTypesAndNonObjectsAreDropped)
{
    EXPECT_FALSE(host::decode_message(json{ { "type", "broadcast" }, { "event", "pageChange" } }, s_plugin_id).has_value());
    EXPECT_FALSE(host::decode_message(json{ { "actionId", "x" } }, s_plugin_id).has_value());
    EXPECT_FALSE(host::decode_message(json::array({ 1, 2 }), s_plugin_id).has_value());
    EXPECT_FALSE(host::decode_message(json("info"), s_plugin_id).has_value());
}

TEST(HostProtocolTest, ValuesAreConvertedToText)
{
    EXPECT_EQ("hello", host::value_to_string(json("hello")));
    EXPECT_EQ("", host::value_to_string(json()));
    EXPECT_EQ("true", host::value_to_string(json(true)));
    EXPECT_EQ("42", host::value_to_string(json(42)));
    EXPECT_EQ("[1,2]", host::value_to_string(json::array({ 1, 2 })));
}

TEST(HostProtocolTest, FlattenSettingsSkipsNonObjects)
{
    json settings = json::parse(R"([ { "A": "1" }, "junk", { "B": 2 } ])");

    host::settings_map expected = { { "A", "1" }, { "B", "2" } };
    EXPECT_EQ(expected, host::flatten_settings(settings));
    EXPECT_TRUE(host::flatten_settings(json::object()).empty());
}

TEST(HostProtocolTest, FlattenSettingsLeavesOutNullValues)
{
    json settings = json::parse(R"([ { "Example Setting": null }, { "Other": "" } ])");

    host::settings_map expected = { { "Other", "" } };
    EXPECT_EQ(expected, host::flatten_settings(settings));
}

TEST(HostProtocolTest, ActionDataToleratesMissingMembers)
{
    json data = json::parse(R"([ { "value": "no id" }, { "id": "only.id" }, 7 ])");

    auto fields = host::parse_action_data(data);

    ASSERT_EQ(2u, fields.size());
    EXPECT_EQ("", fields[0].id);
    EXPECT_EQ("no id", fields[0].value);
    EXPECT_EQ("only.id", fields[1].id);
    EXPECT_EQ("", fields[1].value);
}
