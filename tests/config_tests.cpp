/*
Configuration parsing tests for XML and JSON files.
*/
#include <stdio.h>

#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "test_fixtures.hpp"
#include "../src/config/config.hpp"

static void write_file(const std::string& filename, const std::string& content)
{
    std::ofstream out(filename);
    out << content;
}

static const char* xml_configuration =
    "<?xml version=\"1.0\"?>\n"
    "<configuration>\n"
    "    <domain>simple_travel</domain>\n"
    "    <planner>\n"
    "        <max_depth>50</max_depth>\n"
    "        <verbose>1</verbose>\n"
    "        <goal_policy>Strict</goal_policy>\n"
    "    </planner>\n"
    "    <state>\n"
    "        <!-- people -->\n"
    "        <fact><subject>alice</subject><predicate>location</predicate><value>home_a</value></fact>\n"
    "        <fact><subject>alice</subject><predicate>cash</predicate><value>20</value><value_type>float</value_type></fact>\n"
    "        <fact><subject>code</subject><predicate>pin</predicate><value>0042</value><value_type>string</value_type></fact>\n"
    "    </state>\n"
    "    <todos>\n"
    "        <todo><type>task</type><name>travel</name><args><arg>alice</arg><arg>park</arg></args></todo>\n"
    "        <todo><type>goal</type><predicate>location</predicate><subject>bob</subject><value>park</value></todo>\n"
    "        <todo><type>multigoal</type><goals>\n"
    "            <goal><predicate>pos</predicate><subject>a</subject><value>b</value></goal>\n"
    "            <goal><predicate>count</predicate><subject>a</subject><value>3</value></goal>\n"
    "        </goals></todo>\n"
    "    </todos>\n"
    "    <output>\n"
    "        <output_type>file</output_type>\n"
    "        <file_type>json</file_type>\n"
    "        <file_path>plan.json</file_path>\n"
    "    </output>\n"
    "</configuration>\n";

static const char* json_configuration =
    "{\n"
    "    \"configuration\": {\n"
    "        \"domain\": \"blocks_world\",\n"
    "        \"todos\": [\n"
    "            {\"type\": \"task\", \"name\": \"take\", \"args\": [\"c\"]},\n"
    "            {\"type\": \"goal\", \"predicate\": \"pos\", \"subject\": \"c\", \"value\": \"table\"}\n"
    "        ]\n"
    "    }\n"
    "}\n";

static int test_xml_configuration()
{
    write_file("config_test.xml", xml_configuration);

    ConfigManager cfg_manager;
    std::map<std::string, config_value> cfg = cfg_manager.parse_configuration_file("config_test.xml");

    EXPECT((std::get<std::map<std::string,std::string>>(cfg[domain_config_key])[name_key] == "simple_travel"), "domain name");

    PlannerOptions options = parse_planner_options(std::get<std::map<std::string,std::string>>(cfg[planner_config_key]));
    EXPECT(options.max_depth == 50, "max depth");
    EXPECT(options.verbose == 1, "verbose");
    EXPECT(options.goal_policy == STRICTGOALS, "strict goals");

    State state = std::get<State>(cfg[state_config_key]);
    EXPECT(state.size() == 3, "three facts, comment ignored");
    EXPECT(state.matches("location", "alice", std::string("home_a")), "string fact");
    boost::optional<fact_value> cash = state.get_fact("alice", "cash");
    EXPECT(cash && std::holds_alternative<float>(cash.get()), "declared float");
    boost::optional<fact_value> pin = state.get_fact("code", "pin");
    EXPECT(pin && std::holds_alternative<std::string>(pin.get()) && std::get<std::string>(pin.get()) == "0042", "declared string");

    std::vector<Todo> todos = std::get<std::vector<Todo>>(cfg[todos_config_key]);
    EXPECT(todos.size() == 3, "three todos");

    EXPECT(get_todo_type(todos[0]) == TASKTODO, "task todo");
    Task t = std::get<Task>(todos[0].content);
    EXPECT(t.name == "travel" && t.args.size() == 2, "task name and args");
    EXPECT(std::get<std::string>(t.args[1]) == "park", "task arg");

    EXPECT(get_todo_type(todos[1]) == GOALTODO, "goal todo");
    EXPECT(goals_equal(std::get<Goal>(todos[1].content), make_goal("location", "bob", std::string("park"))), "goal content");

    EXPECT(get_todo_type(todos[2]) == MULTIGOALTODO, "multigoal todo");
    Multigoal mg = std::get<Multigoal>(todos[2].content);
    EXPECT(mg.goals.size() == 2, "two goals");
    EXPECT(std::holds_alternative<int>(mg.goals[1].value), "inferred int goal value");

    std::vector<std::string> output = std::get<std::vector<std::string>>(cfg[output_config_key]);
    EXPECT(output.size() == 3, "output info");
    EXPECT(output[0] == "FILE" && output[1] == "plan.json" && output[2] == "JSON", "output type, path and file type");
    return 0;
}

static int test_json_configuration()
{
    write_file("config_test.json", json_configuration);

    ConfigManager cfg_manager;
    std::map<std::string, config_value> cfg = cfg_manager.parse_configuration_file("config_test.json");

    EXPECT((std::get<std::map<std::string,std::string>>(cfg[domain_config_key])[name_key] == "blocks_world"), "domain name");
    EXPECT(cfg.find(planner_config_key) == cfg.end(), "no planner options");
    EXPECT(cfg.find(state_config_key) == cfg.end(), "no state");
    EXPECT(cfg.find(output_config_key) == cfg.end(), "no output");

    std::vector<Todo> todos = std::get<std::vector<Todo>>(cfg[todos_config_key]);
    EXPECT(todos.size() == 2, "two todos");
    EXPECT(std::get<Task>(todos[0].content).args.size() == 1, "one task argument");
    EXPECT(std::get<Goal>(todos[1].content).subject == "c", "goal subject");
    return 0;
}

static bool configuration_fails(const std::string& filename, const std::string& content)
{
    write_file(filename, content);

    try {
        ConfigManager cfg_manager;
        cfg_manager.parse_configuration_file(filename);
    } catch(const std::runtime_error& e) {
        return true;
    }

    return false;
}

static int test_invalid_configurations()
{
    EXPECT(configuration_fails("missing_todos.xml", "<configuration><domain>blocks_world</domain></configuration>"), "todos are mandatory");
    EXPECT(configuration_fails("missing_domain.xml", "<configuration><todos/></configuration>"), "domain is mandatory");
    EXPECT(configuration_fails("no_root.xml", "<settings><domain>blocks_world</domain></settings>"), "configuration root is mandatory");
    EXPECT(configuration_fails("bad_todo.xml",
        "<configuration><domain>blocks_world</domain><todos><todo><type>wish</type></todo></todos></configuration>"), "unknown todo type");
    EXPECT(configuration_fails("bad_goal.xml",
        "<configuration><domain>blocks_world</domain><todos><todo><type>goal</type><subject>a</subject></todo></todos></configuration>"), "goal without predicate");
    EXPECT(configuration_fails("bad_output.xml",
        "<configuration><domain>blocks_world</domain><todos/><output><output_type>FILE</output_type><file_type>YAML</file_type>"
        "<file_path>plan.yaml</file_path></output></configuration>"), "unsupported output file type");
    EXPECT(configuration_fails("bad_json.json", "{\"configuration\": "), "malformed JSON");
    return 0;
}

static int test_planner_options()
{
    std::map<std::string,std::string> planner_cfg;

    PlannerOptions defaults = parse_planner_options(planner_cfg);
    EXPECT(defaults.max_depth == default_max_depth, "default depth");
    EXPECT(defaults.verbose == 0, "default verbosity");
    EXPECT(defaults.goal_policy == PERMISSIVEGOALS, "default goal policy");

    planner_cfg[goal_policy_key] = "permissive";
    planner_cfg[max_depth_key] = "0";
    PlannerOptions options = parse_planner_options(planner_cfg);
    EXPECT(options.max_depth == 0 && options.goal_policy == PERMISSIVEGOALS, "explicit values");

    bool thrown = false;
    planner_cfg[max_depth_key] = "deep";
    try {
        parse_planner_options(planner_cfg);
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "non numeric depth");

    thrown = false;
    planner_cfg[max_depth_key] = "-1";
    try {
        parse_planner_options(planner_cfg);
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "negative depth");

    thrown = false;
    planner_cfg[max_depth_key] = "10";
    planner_cfg[goal_policy_key] = "lenient";
    try {
        parse_planner_options(planner_cfg);
    } catch(const std::runtime_error& e) {
        thrown = true;
    }
    EXPECT(thrown, "unknown goal policy");
    return 0;
}

int main(void)
{
    if (test_xml_configuration() != 0) return 1;
    if (test_json_configuration() != 0) return 1;
    if (test_invalid_configurations() != 0) return 1;
    if (test_planner_options() != 0) return 1;
    return 0;
}
