/*
 * To compile this example on linux:
 *    g++ example.cpp -Iinclude -o example.bin `pkg-config --libs sqlite3` -std=c++20
 */
#include "datamap/datamap.hpp"
#include <iomanip>
#include <iostream>

using namespace datamap;

/**
 * Student - This is the "Object" in ORM for this example
 *
 *           Each persisted field is a `Slot`, which knows whether it has
 *           been loaded yet. Entity<Student> adds the bookkeeping of a
 *           resource: is it new, which repository it came from, and what
 *           has changed since it was read.
 */
struct Student : Entity<Student> {
    Slot<int64_t> id;
    Slot<std::string> name;
    Slot<int64_t> year;
    Slot<double> gpa;
    Slot<bool> enrolled;
    Slot<std::string> transcript;

    /**
     * model - the "schema" for the table 'students'
     *
     *         Each property names a field type, the options it is given
     *         override the defaults of that type. `Text` properties are
     *         lazy, they are only read when they are first accessed.
     */
    static const Model<Student>& model() {
        static const Model<Student> model("Student", [](Model<Student>& m) {
            m.property<&Student::id>("id", "Serial");
            m.property<&Student::name>("name", "String", { .nullable = false, .length = 100 });
            m.property<&Student::year>("year", "Integer", { .default_value = 1 });
            m.property<&Student::gpa>("gpa", "Decimal", { .precision = 3, .scale = 2 });
            m.property<&Student::enrolled>("enrolled?", "Boolean", { .default_value = true });
            m.property<&Student::transcript>("transcript", "Text");
        });
        return model;
    }
};

static void logger(log_level level, const std::string_view& msg) {
    if (level > log_level::Info) return;
    std::cout << "datamap (" << (int)level << "): " << msg << std::endl;
}

int main (void) {
    // the adapter opens a connection to `school.db` for every operation
    auto adapter = std::make_shared<SqliteAdapter>("default", "sqlite3:school.db", logger);

    // tables are not created for us, hand written SQL goes straight to the adapter
    adapter->execute("DROP TABLE IF EXISTS students");
    adapter->execute("CREATE TABLE students ("
            "id INTEGER PRIMARY KEY AUTOINCREMENT, "
            "name TEXT NOT NULL, "
            "year INTEGER, "
            "gpa REAL, "
            "enrolled INTEGER, "
            "transcript TEXT)");

    Repository repository("default", adapter);

    // and now we can start saving some students
    Student zach;
    zach.attribute_set("name", "zach");
    repository.save(zach);

    // this ran the following query, `year` and `enrolled` picked up their defaults:
    /*
     * INSERT INTO "students" ("name", "year", "enrolled") VALUES (?, ?, ?) RETURNING "id"
     */
    std::cout << "zach was given id " << zach.id.value().value() << "\n";

    // find a record by its key
    auto found = repository.get<Student>(zach.id.value().value());
    if (!found) {
        throw std::runtime_error("Couldn't find new student");
    }

    // update a record, only the changed field is written
    found->attribute_set("gpa", 3.14);
    repository.save(*found);

    // find a record by some other field
    auto query = repository.query<Student>();
    query.where(condition_op_t::LIKE, "name", "za%");
    auto by_name = repository.first<Student>(query);
    if (!by_name) {
        throw std::runtime_error("Couldn't find zach");
    }

    struct Enrollment {
        std::string name;
        int64_t year;
        double gpa;
    };

    for (const auto& e : std::vector<Enrollment> {
        { "jojo",    1, 3.44 },
        { "janet",   2, 2.4  },
        { "bob",     2, 3.9  },
        { "billie",  3, 3.95 },
        { "wayne",   3, 2.98 },
        { "charlie", 1, 1.3  },
        { "mac",     3, 1.0  },
        { "dee",     3, 2.99 },
        { "dennis",  3, 3.1  },
    }) {
        Student student;
        student.attribute_set("name", e.name);
        student.attribute_set("year", e.year);
        student.attribute_set("gpa", e.gpa);
        student.attribute_set("transcript", "Enrolled in year " + std::to_string(e.year));
        repository.save(student);
    }

    constexpr auto PASS_GPA = 3.0;

    // find many records with more than one condition, they are AND-ed together
    auto passing = repository.query<Student>();
    passing.where(condition_op_t::GTE, "gpa", PASS_GPA)
        .where(condition_op_t::GTE, "year", 2)
        .order("gpa", order_t::DESC);

    std::cout << "Students who have a passing GPA >= "
        << std::fixed << std::setprecision(1) << PASS_GPA
        << ":\n";

    for (const auto& student : repository.all<Student>(passing)) {
        std::cout << "\t" << student->name.value().value() << "\n";
    }

    // ranges, `min...max` leaves out the end
    auto middling = repository.query<Student>();
    middling.where(condition_op_t::EQL, "gpa", Range::exclusive(2.0, 3.0));
    std::cout << "There are " << repository.all<Student>(middling).size()
        << " students with a GPA from 2.0 up to 3.0\n";

    // the transcript was not selected, it is read on first access
    auto dennis = repository.first<Student>(repository.query<Student>().where(condition_op_t::EQL, "name", "dennis"));
    if (dennis) {
        std::cout << "dennis: " << dennis->attribute_get("transcript") << "\n";
    }

    // raw SQL for anything the query model doesn't cover
    for (const auto& record : adapter->query("SELECT year, COUNT(*) AS NumStudents FROM students GROUP BY year")) {
        const auto& row = std::get<Row>(record);
        std::cout << "There are " << row["num_students"] << " students "
            "in year " << row["year"] << "\n";
    }
}
