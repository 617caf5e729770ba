#include "comment_engine/comment_tree.hpp"
#include "comment_engine/errors.hpp"
#include "comment_engine/logging.hpp"
#include "comment_engine/render.hpp"
#include <filesystem>
#include <iostream>

using namespace comments;

static void build_sample(CommentTree& tree) {
    tree.add_comment(1, "Root comment", "Alice");
    tree.add_comment(2, "Reply to root", "Bob", 1);
    tree.add_comment(3, "Another reply", "Charlie", 1);
    tree.add_comment(4, "Nested reply", "Dave", 2);
    tree.add_comment(5, "Further nested reply", "Eve", 4);
    tree.add_comment(6, "Sibling reply to nested", "Frank", 2);
    tree.add_comment(7, "Deeply nested reply", "Grace", 5);
    tree.add_comment(8, "Another root-level comment", "Hank");
    tree.add_comment(9, "Reply to another root-level comment", "Ivy", 8);
    tree.add_comment(10, "Nested under Ivy", "Jack", 9);
    tree.add_comment(11, "Another reply to Ivy", "Ken", 9);
    tree.add_comment(12, "Reply to Charlie", "Liam", 3);
    tree.add_comment(13, "Further nesting under Ken", "Mia", 11);
    tree.add_comment(14, "Another deeply nested reply", "Nina", 13);
    tree.add_comment(15, "Sibling to deeply nested", "Oscar", 13);
    tree.add_comment(16, "Independent root-level comment", "Pam");
    tree.add_comment(17, "Reply to Pam", "Quincy", 16);
}

static void print_view(const char* title, const CommentTree& tree) {
    std::cout << '\n' << title << ":\n";
    for (const auto& line : render_tree_view(tree)) std::cout << line << '\n';
}

int main(int argc, char** argv) {
    configure_logging_from_env();
    const std::filesystem::path outDir = argc > 1 ? std::filesystem::path(argv[1]) : std::filesystem::current_path();
    try {
        CommentTree tree;
        build_sample(tree);

        std::cout << "DFS:\n";
        tree.print_depth_first(std::cout, 1);
        std::cout << "\nBFS:\n";
        tree.print_breadth_first(std::cout, 1);

        tree.delete_comment(4);

        const auto jsonPath = outDir / "comments_tree.json";
        const auto xmlPath = outDir / "comments_tree.xml";
        tree.to_json(jsonPath);
        tree.to_xml(xmlPath);

        CommentTree fromJson;
        fromJson.load_json_file(jsonPath);
        print_view("Imported from JSON", fromJson);

        CommentTree fromXml;
        fromXml.load_xml_file(xmlPath);
        print_view("Imported from XML", fromXml);
    } catch (const CommentTreeError& e) {
        engine_logger()->error("{}", e.what());
        return 1;
    }
    return 0;
}
