#include "modules/entity_generator.hh"
#include "modules/entity_sink.hh"
#include "modules/server.hh"
#include "modules/entity_gate.hh"
#include "modules/resource.hh"
#include "modules/seize.hh"
#include "modules/pack.hh"
#include "queue.hh"
#include "threshold.hh"
#include "time_series.hh"
#include "time_series_threshold.hh"
#include "downtime_entity.hh"

#define REGISTER_ENTITY \
    EntityFactory::registerType<EntityGenerator>("EntityGenerator"); \
    EntityFactory::registerType<EntitySink>("EntitySink"); \
    EntityFactory::registerType<Queue>("Queue"); \
    EntityFactory::registerType<Server>("Server"); \
    EntityFactory::registerType<EntityGate>("EntityGate"); \
    EntityFactory::registerType<Resource>("Resource"); \
    EntityFactory::registerType<Seize>("Seize"); \
    EntityFactory::registerType<Release>("Release"); \
    EntityFactory::registerType<Pack>("Pack"); \
    EntityFactory::registerType<Unpack>("Unpack"); \
    EntityFactory::registerType<SignalThreshold>("SignalThreshold"); \
    EntityFactory::registerType<TimeSeries>("TimeSeries"); \
    EntityFactory::registerType<TimeSeriesThreshold>("TimeSeriesThreshold"); \
    EntityFactory::registerType<DowntimeEntity>("DowntimeEntity");
