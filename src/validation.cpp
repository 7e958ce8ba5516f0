#include "validation.h"
#include "utils.h"

#include <cmath>
#include <sstream>

namespace ga
{

    [[noreturn]] void fail(const std::string &msg)
    {
        throw InvalidInput(msg);
    }

    static void check_cost(const json &v, const std::string &where)
    {
        if (!v.is_number())
            fail(where + ": cost must be numeric");
        const double c = v.get<double>();
        if (!std::isfinite(c))
            fail(where + ": cost must be finite");
        if (c < 0)
            fail(where + ": cost must be non-negative");
    }

    bool is_preference_data(const json &data)
    {
        return data.is_array() && !data.empty() && data[0].is_object() && data[0].contains("answers");
    }

    void validate_agents(const json &agents)
    {
        std::vector<std::string> task_order;
        for (size_t i = 0; i < agents.size(); ++i)
        {
            const auto &a = agents[i];
            std::ostringstream where;
            where << "agent[" << i << "]";

            if (!a.is_object())
                fail(where.str() + " must be an object");
            if (!a.contains("agentId") || a["agentId"].is_null())
                fail(where.str() + " has no agentId");
            if (!a.contains("answers") || !a["answers"].is_array())
                fail(where.str() + " has no answers array");

            const auto &answers = a["answers"];
            if (answers.empty())
                fail(where.str() + " has no answers");
            if (i > 0 && answers.size() != task_order.size())
                fail(where.str() + " answers " + std::to_string(answers.size()) +
                     " tasks, expected " + std::to_string(task_order.size()));

            for (size_t j = 0; j < answers.size(); ++j)
            {
                const auto &ans = answers[j];
                const std::string at = where.str() + ".answers[" + std::to_string(j) + "]";
                if (!ans.is_object() || !ans.contains("taskId"))
                    fail(at + " has no taskId");
                if (!ans.contains("cost"))
                    fail(at + " has no cost");
                check_cost(ans["cost"], at);

                const std::string task_id = id_to_string(ans["taskId"]);
                if (i == 0)
                    task_order.push_back(task_id);
                else if (task_order[j] != task_id)
                    fail(at + " task " + task_id + " out of order, expected " + task_order[j]);
            }
        }
    }

    void validate_matrix(const json &matrix)
    {
        if (!matrix[0].is_array() || matrix[0].empty())
            fail("cost matrix rows must be non-empty arrays");
        const size_t cols = matrix[0].size();
        for (size_t i = 0; i < matrix.size(); ++i)
        {
            const auto &row = matrix[i];
            if (!row.is_array() || row.size() != cols)
                fail("cost matrix row " + std::to_string(i) + " size mismatch, expected " +
                     std::to_string(cols));
            for (size_t j = 0; j < cols; ++j)
                check_cost(row[j], "matrix[" + std::to_string(i) + "][" + std::to_string(j) + "]");
        }
    }

    void validate_names(const json &names, std::size_t expected, const std::string &what)
    {
        if (names.is_null())
            return;
        if (!names.is_array())
            fail(what + " must be an array");
        if (names.size() != expected)
            fail(what + " has " + std::to_string(names.size()) + " entries, expected " +
                 std::to_string(expected));
    }

    void validate_input(const json &data, const json &row_names, const json &col_names)
    {
        if (!data.is_array() || data.empty())
            fail("data must be a non-empty array");

        if (is_preference_data(data))
        {
            validate_agents(data);
            return;
        }

        validate_matrix(data);
        validate_names(row_names, data.size(), "rowNames");
        validate_names(col_names, data[0].size(), "colNames");
    }

    void validate_options(const GeneticOptions &o)
    {
        if (o.population_size <= 0)
            fail("populationSize must be positive");
        if (o.max_generations <= 0)
            fail("maxGenerations must be positive");
        if (o.returned_candidates <= 0)
            fail("returnedCandidates must be positive");
        if (!(o.mutation_chance >= 0.0 && o.mutation_chance <= 1.0))
            fail("mutationChance must be within [0, 1]");
        if (!(o.distance_threshold >= 0.0))
            fail("distanceThreshold must be non-negative");
        for (const auto &g : o.groups)
        {
            if (g.max_assignments < 0)
                fail("group " + g.name + ": maxAssignments must be non-negative");
        }
    }

} // namespace ga
