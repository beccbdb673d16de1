#ifndef __SOLUTIONTREE
#define __SOLUTIONTREE

#include <map>
#include <set>
#include <string>
#include <vector>
#include <memory>

#include <boost/optional/optional.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/graph/adjacency_list.hpp>
#include <boost/graph/properties.hpp>
#include <boost/graph/depth_first_search.hpp>

#include "../state/state.hpp"
#include "../utils/todo.hpp"

const std::string root_expansion_label = "root_expansion";
const std::string task_method_label = "task_method";
const std::string unigoal_method_label = "unigoal_method";
const std::string multigoal_method_label = "multigoal_method";
const std::string default_multigoal_method_label = "default_multigoal_method";

struct SolutionNode {
    int id;
    int parent;
    std::string label;
    Todo task;
    std::vector<int> children;
    std::shared_ptr<const State> state;
    bool visited = false;
    bool expanded = false;
    bool is_primitive = false;
    bool is_durative = false;
    boost::optional<std::string> method_tried;
    std::set<std::string> blacklisted_methods;
};

struct STEdge {
    int source;
    int target;
};

typedef boost::adjacency_list<boost::vecS,boost::vecS,
                                boost::directedS,
                                SolutionNode,
                                STEdge> STGraph;

typedef boost::graph_traits<STGraph>::vertex_descriptor st_vertex_t;

class SolutionTreeDFSVisitor : public boost::default_dfs_visitor {
  public:
    SolutionTreeDFSVisitor() : vv(new std::vector<int>()) {}

    void discover_vertex(int v, const STGraph &st) const {
        vv->push_back(v);
        return;
    }

    std::vector<int> &GetVector() const { return *vv; }

  private:
    boost::shared_ptr<std::vector<int> > vv;
};

struct TreeStats {
    int total_nodes;
    int expanded_nodes;
    int primitive_actions;
    int max_depth;
};

/*
    Append-only store of plan nodes. Node ids are dense vertex indexes and are never reused
*/
class SolutionTree {
    public:
        SolutionTree(std::vector<Todo> todos, const State& state);

        static SolutionTree create_from_actions(std::vector<PrimitiveTask> actions, std::vector<Todo> goals, const State& state);

        std::vector<int> insert_children(int parent_id, std::vector<Todo> subtasks, std::string method_label, const State& state);

        void mark_primitive(int node_id);
        void mark_completed(int node_id);

        void blacklist_method(int node_id, std::string method_id);
        void blacklist_command(std::string command_name);
        void add_goal_dependency(int node_id, int dependent_id);

        std::vector<int> get_descendants(int node_id) const;
        std::vector<int> preorder_nodes() const;
        std::vector<PrimitiveTask> extract_primitive_actions() const;

        boost::optional<int> find_next_unexpanded() const;

        bool is_complete() const;
        bool has_node(int node_id) const;

        const SolutionNode& get_node(int node_id) const;
        const std::set<std::string>& get_blacklisted_commands() const;
        const std::map<int,std::vector<int>>& get_goal_network() const;
        const STGraph& get_graph() const;

        std::vector<Todo> get_goals() const;
        TreeStats get_stats() const;

        int plan_cost() const;
        int get_root() const;
        int get_expansions() const;
        int size() const;

    private:
        void check_node(int node_id) const;
        int calculate_max_depth(int node_id, int current_depth) const;

        STGraph tree;
        int root;
        int expansions;
        std::set<std::string> blacklisted_commands;
        std::map<int,std::vector<int>> goal_network;
};

#endif
