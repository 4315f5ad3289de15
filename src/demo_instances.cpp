///////////////////////////
///       IMPORTS       ///
///////////////////////////
#include "demo_instances.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>


///////////////////////////
///       HELPERS       ///
///////////////////////////
static Guest makeGuest(const std::string& id,
                       const std::string& name,
                       const std::string& company,
                       const std::string& department,
                       std::optional<Seniority> seniority,
                       GuestType type) {
    Guest g;
    g.id = id;
    g.name = name;
    g.company = company;
    g.department = department;
    g.seniority = seniority;
    g.type = type;
    return g;
}

static Constraint makeConstraint(const std::string& id,
                                 ConstraintType type,
                                 std::vector<std::string> guestIds,
                                 std::optional<int> value = std::nullopt) {
    Constraint c;
    c.id = id;
    c.type = type;
    c.guestIds = std::move(guestIds);
    c.value = value;
    return c;
}


///////////////////////////
///      DEMO: XS       ///
///////////////////////////
static SeatingProblem makeDemoTiny() {
    SeatingProblem p;
    p.guests.push_back(makeGuest("b1", "Alice Buyer", "Acme", "Procurement", Seniority::SENIOR, GuestType::BUYER));
    p.guests.push_back(makeGuest("b2", "Bob Buyer", "Globex", "Purchasing", Seniority::MID, GuestType::BUYER));
    p.guests.push_back(makeGuest("s1", "Carol Seller", "Initech", "Sales", Seniority::EXECUTIVE, GuestType::SELLER));
    p.guests.push_back(makeGuest("s2", "Dan Seller", "Umbrella", "Sales", Seniority::JUNIOR, GuestType::SELLER));

    p.config.tableCount = 2;
    p.config.seatsPerTable = 2;
    return p;
}


///////////////////////////
///      DEMO: S        ///
///////////////////////////
static SeatingProblem makeDemoSmall() {
    SeatingProblem p;

    p.guests.push_back(makeGuest("g01", "Ava Chen", "Northwind", "Procurement", Seniority::EXECUTIVE, GuestType::BUYER));
    p.guests.push_back(makeGuest("g02", "Liam Patel", "Northwind", "Engineering", Seniority::SENIOR, GuestType::NEUTRAL));
    p.guests.push_back(makeGuest("g03", "Mia Rossi", "Contoso", "Sales", Seniority::MID, GuestType::SELLER));
    p.guests.push_back(makeGuest("g04", "Noah Kim", "Contoso", "Sales", Seniority::JUNIOR, GuestType::SELLER));
    p.guests.push_back(makeGuest("g05", "Emma Silva", "Fabrikam", "Operations", Seniority::SENIOR, GuestType::BUYER));
    p.guests.push_back(makeGuest("g06", "Lucas Meyer", "Fabrikam", "Finance", Seniority::MID, GuestType::NEUTRAL));
    p.guests.push_back(makeGuest("g07", "Olivia Novak", "Tailspin", "Marketing", Seniority::EXECUTIVE, GuestType::CATALYST));
    p.guests.push_back(makeGuest("g08", "Ethan Brown", "Tailspin", "Sales", Seniority::JUNIOR, GuestType::SELLER));
    p.guests.push_back(makeGuest("g09", "Sofia Garcia", "Litware", "Procurement", Seniority::MID, GuestType::BUYER));
    p.guests.push_back(makeGuest("g10", "Leo Dubois", "Litware", "Engineering", std::nullopt, GuestType::NEUTRAL));
    p.guests.push_back(makeGuest("g11", "Zoe Martin", "Adatum", "Community", Seniority::SENIOR, GuestType::CATALYST));
    p.guests.push_back(makeGuest("g12", "Max Weber", "", "Research", Seniority::JUNIOR, GuestType::NEUTRAL));

    // Colleagues who already know each other.
    p.guests[0].knownConnections = {"g02"};
    p.guests[2].knownConnections = {"g04", "g08"};
    p.guests[4].knownConnections = {"g06"};
    p.guests[8].knownConnections = {"g10"};

    p.constraints.push_back(makeConstraint("c1", ConstraintType::MUST_SIT_TOGETHER, {"g01", "g07"}));
    p.constraints.push_back(makeConstraint("c2", ConstraintType::MUST_NOT_SIT_TOGETHER, {"g03", "g04"}));
    p.constraints.push_back(makeConstraint("c3", ConstraintType::MAX_SELLERS_PER_TABLE, {}, 2));
    p.constraints.push_back(makeConstraint("c4", ConstraintType::MIN_BUYERS_PER_TABLE, {}, 1));

    p.config.tableCount = 3;
    p.config.seatsPerTable = 5;
    return p;
}


///////////////////////////
///   DEMO: GENERATED   ///
///////////////////////////
/**
 * @brief Synthetic event of a given size.
 *
 * Guest i works for company i % companies and department (i / 3) % departments;
 * one in four guests is a buyer, one in four a seller, one in eight a
 * catalyst. Each guest knows the next guest of the same company.
 */
static SeatingProblem makeGenerated(int numGuests, int tableCount, int seatsPerTable) {
    static const std::vector<std::string> firstNames = {
            "Ava", "Liam", "Mia", "Noah", "Emma", "Lucas", "Olivia", "Ethan",
            "Sofia", "Leo", "Zoe", "Max", "Ines", "Hugo", "Nora", "Felix"
    };
    static const std::vector<std::string> lastNames = {
            "Chen", "Patel", "Rossi", "Kim", "Silva", "Meyer", "Novak", "Brown",
            "Garcia", "Dubois", "Martin", "Weber", "Costa", "Berg", "Ivanova"
    };
    static const std::vector<std::string> companies = {
            "Northwind", "Contoso", "Fabrikam", "Tailspin", "Litware", "Adatum",
            "Proseware", "Wingtip", "Lucerne", "Margie"
    };
    static const std::vector<std::string> departments = {
            "Procurement", "Sales", "Engineering", "Finance", "Marketing", "Operations", "Research"
    };

    SeatingProblem p;
    int numCompanies = std::min((int)companies.size(), std::max(2, numGuests / 4));

    for (int i = 0; i < numGuests; ++i) {
        GuestType type = GuestType::NEUTRAL;
        if (i % 4 == 0) type = GuestType::BUYER;
        else if (i % 4 == 1) type = GuestType::SELLER;
        else if (i % 8 == 2) type = GuestType::CATALYST;

        std::string name = firstNames[i % firstNames.size()] + " " + lastNames[(i / 2) % lastNames.size()];
        Guest g = makeGuest("guest_" + std::to_string(i + 1), name,
                            companies[i % numCompanies],
                            departments[(i / 3) % departments.size()],
                            (Seniority)((i * 7) % SENIORITY_LEVELS),
                            type);
        if (i + numCompanies < numGuests) {
            g.knownConnections.push_back("guest_" + std::to_string(i + numCompanies + 1));
        }
        p.guests.push_back(std::move(g));
    }

    p.constraints.push_back(makeConstraint("together_1", ConstraintType::MUST_SIT_TOGETHER,
                                           {"guest_2", "guest_7"}));
    p.constraints.push_back(makeConstraint("together_2", ConstraintType::MUST_SIT_TOGETHER,
                                           {"guest_10", "guest_11", "guest_12"}));
    p.constraints.push_back(makeConstraint("apart_1", ConstraintType::MUST_NOT_SIT_TOGETHER,
                                           {"guest_1", "guest_5", "guest_9"}));
    p.constraints.push_back(makeConstraint("sellers_cap", ConstraintType::MAX_SELLERS_PER_TABLE, {},
                                           seatsPerTable / 2));

    p.config.tableCount = tableCount;
    p.config.seatsPerTable = seatsPerTable;
    return p;
}


///////////////////////////
///        DEMOS        ///
///////////////////////////
SeatingProblem makeDemoProblem(DemoSize size) {
    switch (size) {
        case DemoSize::XS: return makeDemoTiny();
        case DemoSize::S: return makeDemoSmall();
        case DemoSize::M: return makeGenerated(40, 6, 8);
        case DemoSize::L: return makeGenerated(120, 15, 10);
        case DemoSize::XL: return makeGenerated(400, 50, 10);
    }
    return makeDemoSmall();
}

DemoSize parseDemoSize(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char ch) { return (char)std::toupper(ch); });
    if (upper == "XS") return DemoSize::XS;
    if (upper == "S") return DemoSize::S;
    if (upper == "M") return DemoSize::M;
    if (upper == "L") return DemoSize::L;
    if (upper == "XL") return DemoSize::XL;
    throw std::runtime_error("Unknown demo size '" + name + "' (expected XS, S, M, L or XL)");
}

std::string toString(DemoSize size) {
    switch (size) {
        case DemoSize::XS: return "XS";
        case DemoSize::S: return "S";
        case DemoSize::M: return "M";
        case DemoSize::L: return "L";
        case DemoSize::XL: return "XL";
    }
    return "UNKNOWN";
}
