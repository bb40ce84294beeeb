#include "internal/controller/pod_spec.hpp"

#include "internal/util/errors.hpp"

namespace imc::controller {

namespace {

imc::v1::Pod GenericManagerPod(const imc::v1::InstanceManager& im, const imc::v1::EngineImage& image, const PodTemplateParams& params) {
  imc::v1::Pod pod;

  auto* meta = pod.mutable_metadata();
  meta->set_name(im.metadata().name());
  meta->set_namespace_(params.pod_namespace);

  auto* owner = pod.add_owner_references();
  owner->set_kind(kInstanceManagerKind);
  owner->set_name(im.metadata().name());
  owner->set_uid(im.metadata().uid());

  auto* spec = pod.mutable_spec();
  spec->set_node_name(params.controller_id);
  spec->set_restart_policy("Never");

  auto* container = spec->add_containers();
  container->set_image(image.image());
  container->set_privileged(true);

  return pod;
}

std::string ListenAddress(std::uint32_t port) {
  return "0.0.0.0:" + std::to_string(port);
}

} // namespace

imc::v1::Pod BuildInstanceManagerPod(const imc::v1::InstanceManager& im, const imc::v1::EngineImage& image, const PodTemplateParams& params) {
  auto  pod       = GenericManagerPod(im, image, params);
  auto* container = pod.mutable_spec()->mutable_containers(0);

  switch (im.spec().type()) {
    case imc::v1::INSTANCE_MANAGER_TYPE_ENGINE:
      container->set_name(kEngineManagerContainer);
      container->add_command("engine-manager");
      break;
    case imc::v1::INSTANCE_MANAGER_TYPE_REPLICA:
      container->set_name(kReplicaManagerContainer);
      container->add_command("instance-manager");
      break;
    default:
      throw util::InvalidState("BUG: instance manager " + im.metadata().name() + " has invalid type " +
                               imc::v1::InstanceManagerType_Name(im.spec().type()));
  }

  container->add_command("daemon");
  container->add_command("--listen");
  container->add_command(ListenAddress(params.manager_port));
  return pod;
}

bool IsInstanceManagerPod(const imc::v1::Pod& pod) {
  for (const auto& container : pod.spec().containers()) {
    if (container.name() == kEngineManagerContainer || container.name() == kReplicaManagerContainer) {
      return true;
    }
  }
  return false;
}

} // namespace imc::controller
