#include "solutiontree.hpp"

#include <algorithm>
#include <stdexcept>

using namespace std;

/*
    Function: SolutionTree
    Objective: Constructor for the SolutionTree object. Creates the unexpanded root node holding
    the whole todo list

    @ Input 1: The todo list to be planned
    @ Input 2: The initial planning-time state
    @ Output: void. The SolutionTree object
*/
SolutionTree::SolutionTree(vector<Todo> todos, const State& state) {
    SolutionNode n;

    RootTask r;
    r.todos = todos;

    n.task = r;
    n.parent = -1;
    n.label = "root";
    n.state = std::make_shared<const State>(state);

    st_vertex_t id = boost::add_vertex(n, tree);

    root = id;
    tree[id].id = id;
    expansions = 0;
}

SolutionTree SolutionTree::create_from_actions(vector<PrimitiveTask> actions, vector<Todo> goals, const State& state) {
    SolutionTree solution_tree(goals, state);

    int root_id = solution_tree.root;
    std::shared_ptr<const State> shared_state = solution_tree.tree[root_id].state;

    int index = 0;
    for(PrimitiveTask action : actions) {
        SolutionNode n;

        n.task = action;
        n.parent = root_id;
        n.label = "root_actions_" + to_string(index);
        n.state = shared_state;
        n.visited = true;
        n.expanded = true;
        n.is_primitive = true;

        int node_id = boost::add_vertex(n, solution_tree.tree);
        solution_tree.tree[node_id].id = node_id;

        STEdge e;
        e.source = root_id;
        e.target = node_id;
        boost::add_edge(boost::vertex(root_id, solution_tree.tree), boost::vertex(node_id, solution_tree.tree), e, solution_tree.tree);

        solution_tree.tree[root_id].children.push_back(node_id);
        index++;
    }

    solution_tree.tree[root_id].visited = true;
    solution_tree.tree[root_id].expanded = true;
    solution_tree.tree[root_id].method_tried = string("actions");

    return solution_tree;
}

/*
    Function: insert_children
    Objective: Decompose a node into the given subtasks. Every child starts unexpanded and shares the
    given state snapshot

    @ Input 1: The id of the node being decomposed
    @ Input 2: The subtasks, in execution order
    @ Input 3: The label of the method that generated the subtasks
    @ Input 4: The current planning-time state
    @ Output: The ids of the created children

    NOTE: The parent must exist, must be unexpanded and the subtask list cannot be empty. An empty
    decomposition is expressed with mark_completed
*/
vector<int> SolutionTree::insert_children(int parent_id, vector<Todo> subtasks, string method_label, const State& state) {
    check_node(parent_id);

    if(tree[parent_id].expanded) {
        string expanded_parent_error = "Cannot insert children under node [" + tree[parent_id].label + "]: node is already expanded";

        throw std::runtime_error(expanded_parent_error);
    }
    if(subtasks.empty()) {
        string empty_subtasks_error = "Cannot insert an empty subtask list under node [" + tree[parent_id].label + "]";

        throw std::runtime_error(empty_subtasks_error);
    }

    std::shared_ptr<const State> shared_state = std::make_shared<const State>(state);
    string parent_label = tree[parent_id].label;

    vector<int> children_ids;

    int index = 0;
    for(Todo subtask : subtasks) {
        SolutionNode n;

        n.task = subtask;
        n.parent = parent_id;
        n.label = parent_label + "_" + method_label + "_" + to_string(index);
        n.state = shared_state;

        int child_id = boost::add_vertex(n, tree);
        tree[child_id].id = child_id;

        STEdge e;
        e.source = parent_id;
        e.target = child_id;
        boost::add_edge(boost::vertex(parent_id, tree), boost::vertex(child_id, tree), e, tree);

        children_ids.push_back(child_id);
        index++;
    }

    tree[parent_id].children = children_ids;
    tree[parent_id].method_tried = method_label;
    tree[parent_id].visited = true;
    tree[parent_id].expanded = true;

    expansions++;

    return children_ids;
}

/*
    Function: mark_primitive
    Objective: Mark a node as a terminal primitive node. A Task node becomes a PrimitiveTask, which is
    the only way a PrimitiveTask is ever created

    @ Input: The node id
    @ Output: void
*/
void SolutionTree::mark_primitive(int node_id) {
    check_node(node_id);

    SolutionNode& n = tree[node_id];
    if(holds_alternative<Task>(n.task.content)) {
        Task t = std::get<Task>(n.task.content);

        PrimitiveTask p;
        p.name = t.name;
        p.args = t.args;

        n.task = p;
    }

    n.is_primitive = true;
    n.expanded = true;
    n.visited = true;
}

void SolutionTree::mark_completed(int node_id) {
    check_node(node_id);

    tree[node_id].expanded = true;
    tree[node_id].visited = true;
}

void SolutionTree::blacklist_method(int node_id, string method_id) {
    check_node(node_id);

    tree[node_id].blacklisted_methods.insert(method_id);
}

void SolutionTree::blacklist_command(string command_name) {
    blacklisted_commands.insert(command_name);
}

void SolutionTree::add_goal_dependency(int node_id, int dependent_id) {
    check_node(node_id);
    check_node(dependent_id);

    vector<int>& dependents = goal_network[node_id];
    if(std::find(dependents.begin(), dependents.end(), dependent_id) == dependents.end()) {
        dependents.push_back(dependent_id);
    }
}

vector<int> SolutionTree::get_descendants(int node_id) const {
    check_node(node_id);

    vector<int> descendants;
    for(int child : tree[node_id].children) {
        descendants.push_back(child);

        vector<int> child_descendants = get_descendants(child);
        descendants.insert(descendants.end(), child_descendants.begin(), child_descendants.end());
    }

    return descendants;
}

/*
    Function: preorder_nodes
    Objective: Visit the tree depth first from the root, children from left to right

    @ Output: The node ids in visiting order
*/
vector<int> SolutionTree::preorder_nodes() const {
    SolutionTreeDFSVisitor vis;

    vector<boost::default_color_type> colors(boost::num_vertices(tree));
    boost::depth_first_visit(tree, boost::vertex(root, tree), vis, boost::make_iterator_property_map(colors.begin(), boost::get(boost::vertex_index, tree)));

    return vis.GetVector();
}

/*
    Function: extract_primitive_actions
    Objective: Collect the plan, depth first and left to right from the root

    @ Output: The ordered primitive actions

    NOTE: Only expanded primitive nodes holding a task contribute. Completed nodes without children
    and unexpanded nodes contribute nothing
*/
vector<PrimitiveTask> SolutionTree::extract_primitive_actions() const {
    vector<PrimitiveTask> actions;

    vector<int> to_visit;
    to_visit.push_back(root);

    while(!to_visit.empty()) {
        int current = to_visit.back();
        to_visit.pop_back();

        const SolutionNode& n = tree[current];
        if(n.expanded && n.is_primitive) {
            if(holds_alternative<PrimitiveTask>(n.task.content)) {
                actions.push_back(std::get<PrimitiveTask>(n.task.content));
            } else if(holds_alternative<Task>(n.task.content)) {
                const Task& t = std::get<Task>(n.task.content);

                PrimitiveTask p;
                p.name = t.name;
                p.args = t.args;

                actions.push_back(p);
            }
        } else {
            vector<int>::const_reverse_iterator children_it;
            for(children_it = n.children.rbegin();children_it != n.children.rend();++children_it) {
                to_visit.push_back(*children_it);
            }
        }
    }

    return actions;
}

boost::optional<int> SolutionTree::find_next_unexpanded() const {
    for(int node_id : preorder_nodes()) {
        if(!tree[node_id].expanded && !tree[node_id].is_primitive) {
            return node_id;
        }
    }

    return boost::none;
}

bool SolutionTree::is_complete() const {
    STGraph::vertex_iterator i, end;

    for(boost::tie(i,end) = vertices(tree); i != end; ++i) {
        const SolutionNode& n = tree[*i];

        bool terminal = n.is_primitive && n.expanded;
        if(!terminal && n.children.empty() && n.id != root) {
            return false;
        }
    }

    return true;
}

bool SolutionTree::has_node(int node_id) const {
    return node_id >= 0 && node_id < int(boost::num_vertices(tree));
}

const SolutionNode& SolutionTree::get_node(int node_id) const {
    check_node(node_id);

    return tree[node_id];
}

const set<string>& SolutionTree::get_blacklisted_commands() const {
    return blacklisted_commands;
}

const map<int,vector<int>>& SolutionTree::get_goal_network() const {
    return goal_network;
}

const STGraph& SolutionTree::get_graph() const {
    return tree;
}

vector<Todo> SolutionTree::get_goals() const {
    const Todo& root_task = tree[root].task;

    if(holds_alternative<RootTask>(root_task.content)) {
        return std::get<RootTask>(root_task.content).todos;
    }

    return vector<Todo>{root_task};
}

TreeStats SolutionTree::get_stats() const {
    TreeStats stats;

    stats.total_nodes = size();
    stats.expanded_nodes = 0;

    STGraph::vertex_iterator i, end;
    for(boost::tie(i,end) = vertices(tree); i != end; ++i) {
        if(tree[*i].expanded) {
            stats.expanded_nodes++;
        }
    }

    stats.primitive_actions = extract_primitive_actions().size();
    stats.max_depth = calculate_max_depth(root, 0);

    return stats;
}

int SolutionTree::plan_cost() const {
    return extract_primitive_actions().size();
}

int SolutionTree::get_root() const {
    return root;
}

int SolutionTree::get_expansions() const {
    return expansions;
}

int SolutionTree::size() const {
    return boost::num_vertices(tree);
}

void SolutionTree::check_node(int node_id) const {
    if(!has_node(node_id)) {
        string unknown_node_error = "Node [" + to_string(node_id) + "] does not exist in the solution tree";

        throw std::runtime_error(unknown_node_error);
    }
}

int SolutionTree::calculate_max_depth(int node_id, int current_depth) const {
    int max_depth = current_depth;

    for(int child : tree[node_id].children) {
        max_depth = std::max(max_depth, calculate_max_depth(child, current_depth+1));
    }

    return max_depth;
}
