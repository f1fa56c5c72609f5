#include "SensorTable.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <sstream>
#include <time.h>

class SensorTableTest : public ::testing::Test {
protected:
    void SetUp() override {
        setenv("TZ", "UTC", 1);
        tzset();
    }

    static SensorInfo sensor(int id, const char *protocol, const char *model) {
        SensorInfo info;
        info.id = id;
        info.protocol = protocol;
        info.model = model;
        return info;
    }
};

TEST_F(SensorTableTest, PrintsHeaderAndRows) {
    SensorInfo both = sensor(135, "mandolyn", "temperaturehumidity");
    both.temperature = SensorValue{"21.5", 1700000600};
    both.humidity = SensorValue{"48", 1700000000};

    SensorInfo temperature = sensor(7, "fineoffset", "temperature");
    temperature.temperature = SensorValue{"-3.2", 1700000000};

    std::ostringstream out;
    SensorTable table(out);
    table.print({both, temperature});

    EXPECT_EQ(out.str(),
              "Number of sensors: 2\n"
              "\n"
              "ID    PROTOCOL        MODEL                  TEMP     HUMIDITY LAST UPDATED\n"
              "135   mandolyn        temperaturehumidity    21.5     48       2023-11-14 22:13:20\n"
              "7     fineoffset      temperature            -3.2              2023-11-14 22:13:20\n");
}

TEST_F(SensorTableTest, OmitsSensorsWithoutValues) {
    SensorInfo empty = sensor(1, "arctech", "selflearning");
    SensorInfo humidity = sensor(2, "oregon", "1A2D");
    humidity.humidity = SensorValue{"60", 1700000000};

    std::ostringstream out;
    SensorTable table(out);
    table.print({empty, humidity});

    EXPECT_EQ(out.str(),
              "Number of sensors: 2\n"
              "\n"
              "ID    PROTOCOL        MODEL                  TEMP     HUMIDITY LAST UPDATED\n"
              "2     oregon          1A2D                            60       2023-11-14 22:13:20\n");
}

TEST_F(SensorTableTest, LastUpdatedIsTheEarlierTimestamp) {
    SensorInfo info = sensor(1, "oregon", "1A2D");
    EXPECT_EQ(SensorTable::last_updated(info), 0);

    info.humidity = SensorValue{"60", 200};
    EXPECT_EQ(SensorTable::last_updated(info), 200);

    info.temperature = SensorValue{"20", 300};
    EXPECT_EQ(SensorTable::last_updated(info), 200);

    info.temperature = SensorValue{"20", 100};
    EXPECT_EQ(SensorTable::last_updated(info), 100);
}
